#include "metrics.hpp"
#include "protocol/errors.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace metrics {

const char* const CSV_HEADER =
    "timestamp,client_ip,client_port,filename,file_size_bytes,"
    "duration_seconds,throughput_bytes_per_second";

double compute_throughput(uint64_t bytes, double seconds) {
    return (seconds > 0) ? (static_cast<double>(bytes) / seconds) : 0.0;
}

std::string current_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

TransferRecord make_record(const std::string& timestamp, const std::string& client_address,
                           unsigned short client_port, const std::string& filename,
                           uint64_t file_size_bytes, double duration_seconds) {
    return TransferRecord{
        timestamp,
        client_address,
        client_port,
        filename,
        file_size_bytes,
        duration_seconds,
        compute_throughput(file_size_bytes, duration_seconds)
    };
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string format_row(const TransferRecord& record) {
    std::ostringstream oss;
    oss << csv_escape(record.timestamp) << ','
        << csv_escape(record.client_address) << ','
        << record.client_port << ','
        << csv_escape(record.filename) << ','
        << record.file_size_bytes << ','
        << std::fixed << std::setprecision(6) << record.duration_seconds << ','
        << record.throughput_bytes_per_second;
    return oss.str();
}

Recorder::Recorder(std::string path) : path_(std::move(path)) {}

void Recorder::append(const TransferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool exists = std::filesystem::exists(path_, ec);
    if (ec) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Could not stat metrics file " + path_ + ": " + ec.message());
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Could not open metrics file: " + path_);
    }
    if (!exists) {
        out << CSV_HEADER << "\r\n";
    }
    out << format_row(record) << "\r\n";
    out.flush();
    if (!out) {
        throw protocol::TransferError(protocol::ErrorKind::IO_FAILURE,
                                      "Could not write metrics file: " + path_);
    }
}

} // namespace metrics
