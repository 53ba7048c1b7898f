#pragma once
#include <string>
#include <cstring>
#include <cstdint>
#include <defs.h>

bool isWhitespace(char thing);

bool isIdentStart(char thing); // [A-Za-z_$]

bool isIdentChar(char thing); // [A-Za-z0-9_$]

bool isNameChar(char thing); // tag, class and block names also allow '-' and ':'

std::string trim(std::string thing); // strip whitespace off both ends

std::string escapeHtml(const std::string& thing); // & < > " become entities

std::string numberToString(double number); // canonical number form: integers lose their ".0", everything else is the shortest round-trip form

std::string fconcat(std::string one, std::string two); // sanely glue two path segments together

std::string trim2dir(std::string file); // directory part of a path, with its trailing /, or "" for a bare filename

std::string normalizePath(std::string path); // collapse "." and ".." segments and doubled slashes. ".." never climbs above the start of the path

bool hasExtension(const std::string& path); // does the last path segment carry a ".ext"?

bool endsWith(const std::string& thing, const std::string& tail);
