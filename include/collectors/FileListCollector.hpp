#pragma once

#include "model/Progress.hpp"
#include "util/BoundedQueue.hpp"
#include <functional>

namespace rapidcopy::collectors {

// Drains a scanner file stream into a FileList (discovery order). Totals are the
// scan-time sizes; nothing is re-stat'ed here.
class FileListCollector {
public:
    using RecordCallback = std::function<void(const model::FileRecord&)>;

    explicit FileListCollector(bool sizes_known = false);

    // Invoked on the draining thread for every record, before it is stored
    void set_on_record(RecordCallback callback) { on_record_ = std::move(callback); }

    // Blocks until the stream is closed
    [[nodiscard]] model::FileList collect(util::BoundedQueue<model::FileRecord>& files);

private:
    bool sizes_known_;
    RecordCallback on_record_;
};

}  // namespace rapidcopy::collectors
