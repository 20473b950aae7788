#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace tinythis {

    std::uintmax_t safe_file_size(const fs::path& path) noexcept {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec) || ec) {
            return 0;
        }
        const auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }

    std::string human_size(const std::uintmax_t bytes) {
        constexpr std::uintmax_t kKiB = 1024;
        std::ostringstream oss;
        if (bytes >= kKiB * kKiB * kKiB) {
            oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (kKiB * kKiB * kKiB) << " GiB";
        } else if (bytes >= kKiB * kKiB) {
            oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (kKiB * kKiB) << " MiB";
        } else if (bytes >= kKiB) {
            oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / kKiB << " KiB";
        } else {
            oss << bytes << " B";
        }
        return oss.str();
    }

    bool is_directory_writable(const fs::path& dir) noexcept {
        std::error_code ec;
        if (!fs::is_directory(dir, ec) || ec) {
            return false;
        }
        return ::access(dir.c_str(), W_OK | X_OK) == 0;
    }

    bool remove_output(const fs::path& path, const std::string_view tag) {
        std::error_code ec;
        const bool removed = fs::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove output: " + path.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        if (removed) {
            Logger::log(LogLevel::Debug, "Removed output: " + path.string(), tag);
        }
        return true;
    }

    void write_file_atomically(const fs::path& target, const std::string_view contents) {
        const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
        fs::create_directories(dir);

        thread_local std::mt19937_64 rng{std::random_device{}()};
        const fs::path tmp = dir / ("." + target.filename().string() + "." + std::to_string(rng()) + ".tmp");
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw fs::filesystem_error("cannot open for writing", tmp,
                                           std::make_error_code(std::errc::permission_denied));
            }
            out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
            out.flush();
            if (!out) {
                std::error_code ec;
                fs::remove(tmp, ec);
                throw fs::filesystem_error("write failed", tmp, std::make_error_code(std::errc::io_error));
            }
        }

        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            throw fs::filesystem_error("rename failed", tmp, target, ec);
        }
    }

} // namespace tinythis
