#include "qcseq/result_store.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>

namespace qcseq {

JsonFileResultStore::JsonFileResultStore(std::string directory)
    : m_directory(std::move(directory)) {
    if (m_directory.empty()) {
        m_directory = ".";
    }
}

PersistResult JsonFileResultStore::Persist(const FinishedSession& session) {
    PersistResult result;
    const std::string path = m_directory + "/" + FileNameFor(session);

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        result.message = "cannot open " + path + ": " + std::strerror(errno);
        return result;
    }

    file << ToJson(session, true) << '\n';
    file.flush();
    if (!file) {
        result.message = "write to " + path + " failed";
        return result;
    }

    result.ok = true;
    result.location = path;
    return result;
}

std::string JsonFileResultStore::FileNameFor(const FinishedSession& session) const {
    std::string device = session.device.id.empty() ? session.device.name : session.device.id;
    if (device.empty()) {
        device = "unknown";
    }
    for (char& c : device) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            c = '-';
        }
    }

    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        session.startedAt.time_since_epoch()).count();
    return "qc_" + device + "_" + std::to_string(epochMs) + ".json";
}

} // namespace qcseq
