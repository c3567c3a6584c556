#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace metrics {

// Column order read by the offline analysis scripts.
extern const char* const CSV_HEADER;

struct TransferRecord {
    std::string timestamp;
    std::string client_address;
    unsigned short client_port;
    std::string filename;
    uint64_t file_size_bytes;
    double duration_seconds;
    double throughput_bytes_per_second;
};

// bytes / seconds, or 0 when no time elapsed.
double compute_throughput(uint64_t bytes, double seconds);

// Local time as YYYY-MM-DDTHH:MM:SS.
std::string current_timestamp();

TransferRecord make_record(const std::string& timestamp, const std::string& client_address,
                           unsigned short client_port, const std::string& filename,
                           uint64_t file_size_bytes, double duration_seconds);

// RFC 4180 quoting for fields containing separators, quotes or newlines.
std::string csv_escape(const std::string& field);

std::string format_row(const TransferRecord& record);

// Append-only CSV store for completed transfers. The header line is written
// only when the file does not exist yet. Appends are serialized internally.
class Recorder {
public:
    explicit Recorder(std::string path);

    // Throws protocol::TransferError(IO_FAILURE) if the row cannot be written.
    void append(const TransferRecord& record);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace metrics
