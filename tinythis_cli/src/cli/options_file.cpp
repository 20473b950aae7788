#include "options_file.hpp"
#include "../../../libtinythis/include/file_utils.hpp"
#include "../../../libtinythis/include/logger.hpp"
#include <fstream>
#include <sstream>

namespace {

    bool is_gpu_line(const std::string& line) {
        size_t i = line.find_first_not_of(" \t");
        if (i == std::string::npos || line.compare(i, 3, "gpu") != 0) {
            return false;
        }
        i = line.find_first_not_of(" \t", i + 3);
        return i != std::string::npos && line[i] == '=';
    }

} // namespace

std::string with_gpu_preference(const std::string& contents, const bool gpu) {
    const std::string entry = std::string("gpu = ") + (gpu ? "true" : "false");

    std::istringstream in(contents);
    std::ostringstream out;
    std::string line;
    bool replaced = false;
    bool in_table = false;
    while (std::getline(in, line)) {
        if (const auto i = line.find_first_not_of(" \t"); i != std::string::npos && line[i] == '[') {
            in_table = true;
        }
        if (!replaced && !in_table && is_gpu_line(line)) {
            out << entry << '\n';
            replaced = true;
            continue;
        }
        out << line << '\n';
    }
    if (replaced) {
        return out.str();
    }
    // top-level keys must precede the first table header
    return entry + '\n' + out.str();
}

void save_gpu_preference(const std::filesystem::path& options_file, const bool gpu) {
    std::string current;
    if (std::ifstream in(options_file, std::ios::binary); in) {
        std::ostringstream ss;
        ss << in.rdbuf();
        current = ss.str();
    }
    tinythis::write_file_atomically(options_file, with_gpu_preference(current, gpu));
    tinythis::Logger::log(tinythis::LogLevel::Info,
                          std::string("saved gpu = ") + (gpu ? "true" : "false") + " to " + options_file.string(),
                          "options");
}
