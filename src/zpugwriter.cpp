#include <zpugwriter.hpp>


void StringWriteOutput::write(const char* data, size_t length) {
    content += std::string(data, length);
}


ZpugWriter::ZpugWriter(WriteOutput& out) : output(out) {}

void ZpugWriter::beginLine(int depth) {
    if (!pretty) {
        return;
    }
    if (written) {
        output.write("\n", 1);
    }
    for (int i = 0; i < depth; i ++) {
        output.write(indentString.c_str(), indentString.size());
    }
    written = true;
}

void ZpugWriter::write(const char* data, size_t length) {
    if (length == 0) {
        return;
    }
    output.write(data, length);
    written = true;
}

void ZpugWriter::write(std::string data) {
    write(data.c_str(), data.size());
}
