#pragma once

#include "qcseq/result_aggregator.h"

#include <string>

namespace qcseq {

/**
 * @brief Writes each finished session as a JSON document into a directory.
 *
 * File name: qc_<device id>_<start epoch ms>.json. The directory must exist.
 */
class JsonFileResultStore : public ResultStore {
public:
    explicit JsonFileResultStore(std::string directory);

    PersistResult Persist(const FinishedSession& session) override;

    const std::string& Directory() const { return m_directory; }

private:
    std::string FileNameFor(const FinishedSession& session) const;

    std::string m_directory;
};

} // namespace qcseq
