#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace statehub::utils
{

/**
 * @brief Appends formatted log lines to a file.
 *
 * The constructor opens (creating if needed) the file and throws std::runtime_error if it
 * cannot; `write` throws std::runtime_error on a short write so the worker can report it
 * through the write-error callback.
 */
class STATEHUB_UTILS_EXPORT FileSink : public Sink
{
  public:
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file{nullptr};
};

} // namespace statehub::utils
