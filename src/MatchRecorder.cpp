#include "MatchRecorder.hpp"

#include <ctime>
#include <stdexcept>

namespace copperhead {

namespace {

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

} // namespace

MatchRecorder::MatchRecorder(const std::string& path)
    : stream_(path, std::ios::out | std::ios::app) {
    if (!stream_) {
        throw std::runtime_error("unable to open results log: " + path);
    }
    stream_.seekp(0, std::ios::end);
    headerWritten_ = stream_.tellp() > 0;
}

void MatchRecorder::record(const MatchRecord& match) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!headerWritten_) {
        writeHeader();
        headerWritten_ = true;
    }
    stream_ << timestamp() << ','
            << match.roomId << ','
            << toString(match.mode) << ','
            << (match.winner ? std::to_string(*match.winner) : std::string("draw")) << ','
            << csvField(match.playerOne) << ','
            << csvField(match.playerTwo) << ','
            << match.lengthOne << ','
            << match.lengthTwo << ','
            << match.ticks << '\n';
    stream_.flush();
}

void MatchRecorder::writeHeader() {
    stream_ << "timestamp,room_id,mode,winner,player1,player2,length1,length2,ticks\n";
}

} // namespace copperhead
