#include "polystore/saga_journal.hpp"

#include <fstream>
#include <sstream>

#include "polystore/error.hpp"
#include "polystore/failure_log.hpp"
#include "polystore/logging.hpp"

namespace polystore {

bool SagaJournalEntry::terminal() const {
    return state == "completed" || state == "compensated" ||
           state == "compensation_failed" || state == "interrupted";
}

SagaJournal::SagaJournal(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create journal directory: " + ec.message(), path_.string());
        }
    }
    replay();
}

void SagaJournal::begin(const std::string& saga_id, const std::string& definition) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();

    SagaJournalEntry& e = entries_[saga_id];
    e = SagaJournalEntry{};
    e.saga_id = saga_id;
    e.definition = definition;
    e.state = "running";
    e.started = now;
    e.updated = now;

    append(begin_line(e));
}

void SagaJournal::record(const std::string& saga_id, const std::string& state,
                         int64_t step, const std::string& detail,
                         const std::string& operation_id,
                         const std::map<std::string, std::string>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    SagaJournalEntry e;
    auto it = entries_.find(saga_id);
    if (it != entries_.end()) e = it->second;
    e.saga_id = saga_id;
    e.state = state;
    e.step = step;
    e.detail = detail;
    e.operation_id = operation_id;
    e.records = records;
    e.updated = Clock::now();

    append(state_line(e));

    if (e.terminal()) {
        entries_.erase(saga_id);
    } else {
        entries_[saga_id] = std::move(e);
    }
}

std::optional<SagaJournalEntry> SagaJournal::get(const std::string& saga_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(saga_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<SagaJournalEntry> SagaJournal::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SagaJournalEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    return out;
}

std::vector<SagaJournalEntry> SagaJournal::interrupted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SagaJournalEntry> out;
    for (const auto& kv : entries_) {
        if (!kv.second.terminal()) out.push_back(kv.second);
    }
    return out;
}

// =============================================================================
// Line format
// =============================================================================

std::string SagaJournal::escape(const std::string& s) {
    std::string o;
    o.reserve(s.size());
    for (char c : s) {
        if (c == '\n') o += "\\n";
        else if (c == '\r') o += "\\r";
        else if (c == '\\') o += "\\\\";
        else o += c;
    }
    return o;
}

std::string SagaJournal::unescape(const std::string& s) {
    std::string o;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[i + 1];
            if (n == 'n') { o += '\n'; ++i; }
            else if (n == 'r') { o += '\r'; ++i; }
            else if (n == 's') { o += ' '; ++i; }
            else if (n == 'c') { o += ','; ++i; }
            else if (n == 'e') { o += '='; ++i; }
            else if (n == '\\') { o += '\\'; ++i; }
            else o += s[i];
        } else {
            o += s[i];
        }
    }
    return o;
}

std::string SagaJournal::field(const std::string& s) {
    if (s.empty()) return "-";
    std::string o;
    for (char c : escape(s)) {
        if (c == ' ') o += "\\s";
        else if (c == ',') o += "\\c";
        else if (c == '=') o += "\\e";
        else o += c;
    }
    return o;
}

std::string SagaJournal::unfield(const std::string& s) {
    return s == "-" ? std::string() : unescape(s);
}

std::string SagaJournal::encode_records(const std::map<std::string, std::string>& records) {
    if (records.empty()) return "-";
    std::string out;
    for (const auto& [role, id] : records) {
        if (!out.empty()) out += ',';
        out += field(role) + "=" + field(id);
    }
    return out;
}

std::map<std::string, std::string> SagaJournal::decode_records(const std::string& text) {
    std::map<std::string, std::string> out;
    if (text == "-") return out;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        const std::string pair = text.substr(pos, comma - pos);
        const size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            out[unfield(pair.substr(0, eq))] = unfield(pair.substr(eq + 1));
        }
        pos = comma + 1;
    }
    return out;
}

std::string SagaJournal::begin_line(const SagaJournalEntry& e) {
    return "BEGIN " + e.saga_id + " " + std::to_string(to_epoch_ms(e.started)) + " " +
           escape(e.definition);
}

std::string SagaJournal::state_line(const SagaJournalEntry& e) {
    return "STATE " + e.saga_id + " " + std::to_string(to_epoch_ms(e.updated)) + " " + e.state + " " +
           std::to_string(e.step) + " " + field(e.operation_id) + " " + encode_records(e.records) +
           " " + escape(e.detail);
}

// =============================================================================
// Persistence
// =============================================================================

void SagaJournal::append(const std::string& line) {
    std::ofstream f(path_, std::ios::app);
    f << line << "\n";
    f.flush();
    if (!f) {
        throw IOError("Journal append failed", path_.string());
    }
}

void SagaJournal::replay() {
    if (!std::filesystem::exists(path_)) return;

    std::ifstream f(path_);
    std::string line;
    size_t line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string tag, id;
        long long ms = 0;
        iss >> tag >> id >> ms;
        if (iss.fail() || id.empty()) {
            LOG_WARN("Skipping malformed journal line ", path_.string(), ":", line_no);
            continue;
        }

        if (tag == "BEGIN") {
            std::string def;
            if (iss.peek() == ' ') iss.get();
            std::getline(iss, def);

            SagaJournalEntry& e = entries_[id];
            e = SagaJournalEntry{};
            e.saga_id = id;
            e.definition = unescape(def);
            e.state = "running";
            e.started = from_epoch_ms(ms);
            e.updated = e.started;
        } else if (tag == "STATE") {
            std::string state, op, records, detail;
            long long step = -1;
            iss >> state >> step >> op >> records;
            if (iss.fail()) {
                LOG_WARN("Skipping malformed journal line ", path_.string(), ":", line_no);
                continue;
            }
            if (iss.peek() == ' ') iss.get();
            std::getline(iss, detail);

            SagaJournalEntry& e = entries_[id];
            e.saga_id = id;
            e.state = state;
            e.step = step;
            e.operation_id = unfield(op);
            e.records = decode_records(records);
            e.detail = unescape(detail);
            e.updated = from_epoch_ms(ms);
            if (e.terminal()) entries_.erase(id);
        } else {
            LOG_WARN("Unknown journal record '", tag, "' at ", path_.string(), ":", line_no);
        }
    }
    f.close();

    LOG_DEBUG("Replayed ", line_no, " journal line(s), ", entries_.size(), " saga(s) in flight");
    compact();
}

void SagaJournal::compact() {
    const std::filesystem::path tmp = path_.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        for (const auto& kv : entries_) {
            out << begin_line(kv.second) << "\n";
            out << state_line(kv.second) << "\n";
        }
        out.flush();
        if (!out) {
            throw IOError("Journal compaction failed", tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        throw IOError("Journal compaction failed: " + ec.message(), path_.string());
    }
}

size_t report_interrupted_sagas(SagaJournal& journal, FailureLog& failure_log) {
    size_t reported = 0;
    for (const SagaJournalEntry& e : journal.interrupted()) {
        LOG_WARN("[", e.saga_id, "] interrupted in state '", e.state, "' at step ", e.step);

        std::string records;
        for (const auto& [role, id] : e.records) {
            if (!records.empty()) records += ", ";
            records += role + "=" + id;
        }

        failure_log.append(e.saga_id, FailureKind::CriticalFailure,
                           {{"status", "REQUIRES_MANUAL_CLEANUP"},
                            {"reason", "saga interrupted before reaching a terminal state"},
                            {"definition", e.definition},
                            {"last_state", e.state},
                            {"last_step", std::to_string(e.step)},
                            {"last_detail", e.detail},
                            {"operation_id", e.operation_id},
                            {"records", records},
                            {"started", format_iso8601(e.started)},
                            {"last_update", format_iso8601(e.updated)}});
        journal.record(e.saga_id, "interrupted", e.step, "reported for manual cleanup",
                       e.operation_id, e.records);
        ++reported;
    }
    return reported;
}

} // namespace polystore
