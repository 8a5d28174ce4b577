#include "polystore/failure_log.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

void append_escaped(std::string& out, std::string_view s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Reader for the flat record shape we write: string values plus one
// nested object of strings. Anything else is rejected.
class JsonReader {
public:
    explicit JsonReader(std::string_view text) : s_(text) {}

    bool parse_record(FailureRecord& rec) {
        std::string timestamp, kind;
        bool have_kind = false;
        if (!expect('{')) return false;
        skip_ws();
        if (peek() == '}') { ++pos_; return false; }

        for (;;) {
            std::string key;
            if (!parse_string(key) || !expect(':')) return false;
            skip_ws();
            if (key == "detail") {
                if (!parse_string_map(rec.detail)) return false;
            } else {
                std::string value;
                if (!parse_string(value)) return false;
                if (key == "timestamp") timestamp = value;
                else if (key == "saga_id") rec.saga_id = value;
                else if (key == "kind") { kind = value; have_kind = true; }
            }
            skip_ws();
            if (peek() == ',') { ++pos_; continue; }
            if (!expect('}')) return false;
            break;
        }
        skip_ws();
        if (pos_ != s_.size() || !have_kind) return false;

        auto parsed_kind = parse_failure_kind(kind);
        if (!parsed_kind) return false;
        rec.kind = *parsed_kind;
        return parse_timestamp(timestamp, rec.timestamp);
    }

private:
    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    void skip_ws() {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t' ||
                                    s_[pos_] == '\r' || s_[pos_] == '\n')) {
            ++pos_;
        }
    }

    bool expect(char c) {
        skip_ws();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    bool parse_hex4(uint32_t& out) {
        if (pos_ + 4 > s_.size()) return false;
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char c = s_[pos_++];
            out <<= 4;
            if (c >= '0' && c <= '9') out |= c - '0';
            else if (c >= 'a' && c <= 'f') out |= 10 + c - 'a';
            else if (c >= 'A' && c <= 'F') out |= 10 + c - 'A';
            else return false;
        }
        return true;
    }

    bool parse_string(std::string& out) {
        skip_ws();
        if (peek() != '"') return false;
        ++pos_;
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') return true;
            if (c != '\\') { out.push_back(c); continue; }
            if (pos_ >= s_.size()) return false;
            char e = s_[pos_++];
            switch (e) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t low = 0;
                        if (pos_ + 2 > s_.size() || s_[pos_] != '\\' || s_[pos_ + 1] != 'u') return false;
                        pos_ += 2;
                        if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF) return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    bool parse_string_map(std::map<std::string, std::string>& out) {
        if (!expect('{')) return false;
        skip_ws();
        if (peek() == '}') { ++pos_; return true; }
        for (;;) {
            std::string key, value;
            if (!parse_string(key) || !expect(':') || !parse_string(value)) return false;
            out[key] = value;
            skip_ws();
            if (peek() == ',') { ++pos_; continue; }
            return expect('}');
        }
    }

    static bool parse_timestamp(const std::string& text, TimePoint& out) {
        // 2025-10-02T12:00:00.123Z
        std::tm tm_buf{};
        std::istringstream in(text);
        in >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
        if (in.fail()) return false;

        int millis = 0;
        if (in.peek() == '.') {
            in.get();
            std::string digits;
            while (std::isdigit(in.peek())) digits.push_back(static_cast<char>(in.get()));
            if (digits.empty()) return false;
            digits.resize(3, '0');
            millis = std::stoi(digits);
        }
        if (in.get() != 'Z') return false;

        time_t secs = timegm(&tm_buf);
        out = Clock::from_time_t(secs) + std::chrono::milliseconds(millis);
        return true;
    }

    std::string_view s_;
    size_t pos_ = 0;
};

} // anonymous namespace

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::OrphanedChunk:   return "orphaned_chunk";
        case FailureKind::OrphanedRecord:  return "orphaned_record";
        case FailureKind::RollbackAlert:   return "rollback_alert";
        case FailureKind::CriticalFailure: return "critical_failure";
    }
    return "unknown";
}

std::optional<FailureKind> parse_failure_kind(std::string_view name) {
    if (name == "orphaned_chunk") return FailureKind::OrphanedChunk;
    if (name == "orphaned_record") return FailureKind::OrphanedRecord;
    if (name == "rollback_alert") return FailureKind::RollbackAlert;
    if (name == "critical_failure") return FailureKind::CriticalFailure;
    return std::nullopt;
}

// =============================================================================
// FailureRecord serialization
// =============================================================================

std::string FailureRecord::to_json() const {
    std::string out;
    out.reserve(128);
    out += "{\"timestamp\":";
    append_escaped(out, format_iso8601(timestamp));
    out += ",\"saga_id\":";
    append_escaped(out, saga_id);
    out += ",\"kind\":";
    append_escaped(out, to_string(kind));
    out += ",\"detail\":{";
    bool first = true;
    for (const auto& [key, value] : detail) {
        if (!first) out.push_back(',');
        first = false;
        append_escaped(out, key);
        out.push_back(':');
        append_escaped(out, value);
    }
    out += "}}";
    return out;
}

std::optional<FailureRecord> FailureRecord::from_json(std::string_view line) {
    FailureRecord rec;
    JsonReader reader(line);
    if (!reader.parse_record(rec)) return std::nullopt;
    return rec;
}

// =============================================================================
// FailureLog
// =============================================================================

FailureLog::FailureLog(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create failure log directory: " + ec.message(), path_.string());
        }
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw IOError(std::string("Cannot open failure log: ") + std::strerror(errno), path_.string());
    }
}

FailureLog::~FailureLog() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void FailureLog::append(const FailureRecord& record) {
    const std::string line = record.to_json() + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    ssize_t n;
    do {
        n = ::write(fd_, line.data(), line.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw IOError(std::string("Failure log write failed: ") + std::strerror(errno), path_.string());
    }
    if (static_cast<size_t>(n) != line.size()) {
        throw IOError("Short write to failure log (" + std::to_string(n) + " of " +
                      std::to_string(line.size()) + " bytes)", path_.string());
    }

    LOG_DEBUG("[", record.saga_id, "] failure record ", to_string(record.kind));
}

void FailureLog::append(const std::string& saga_id, FailureKind kind,
                        std::map<std::string, std::string> detail) {
    FailureRecord rec;
    rec.timestamp = Clock::now();
    rec.saga_id = saga_id;
    rec.kind = kind;
    rec.detail = std::move(detail);
    append(rec);
}

std::vector<FailureRecord> FailureLog::read_all() const {
    std::vector<FailureRecord> out;
    std::ifstream in(path_);
    if (!in.is_open()) {
        return out;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        auto rec = FailureRecord::from_json(line);
        if (!rec) {
            LOG_WARN("Skipping malformed failure record at ", path_.string(), ":", line_no);
            continue;
        }
        out.push_back(std::move(*rec));
    }
    return out;
}

} // namespace polystore
