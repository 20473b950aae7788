/**
 * @file errors.hpp
 * @brief Exception types thrown by the tinythis library.
 *
 * Only operations that are rejected before any work starts throw.
 * Failures of a running encode are recorded on the job instead
 * (see JobResult in encode_job.hpp).
 */

#ifndef TINYTHIS_ERRORS_HPP
#define TINYTHIS_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace tinythis {

/// Base of every tinythis exception.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An input was rejected before a job was created.
 */
class ValidationError final : public Error {
public:
    enum class Reason {
        UnsupportedExtension,
        NotFound,
        NotAFile,
        EmptyFileList
    };

    ValidationError(const Reason reason, std::filesystem::path path, const std::string& message)
        : Error(message), reason_(reason), path_(std::move(path)) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Reason reason_;
    std::filesystem::path path_;
};

/// No encoder executable could be located; nothing was spawned.
class ResourceUnavailable final : public Error {
public:
    using Error::Error;
};

/// Output directory unusable or output name space exhausted.
class FilesystemError final : public Error {
public:
    FilesystemError(std::filesystem::path path, const std::string& message)
        : Error(message), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// The queue refused an operation in the current job state (e.g. removing a running job).
class InvalidOperation final : public Error {
public:
    using Error::Error;
};

} // namespace tinythis

#endif // TINYTHIS_ERRORS_HPP
