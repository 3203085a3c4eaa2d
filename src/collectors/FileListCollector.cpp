#include "collectors/FileListCollector.hpp"
#include "util/Logger.hpp"

namespace rapidcopy::collectors {

FileListCollector::FileListCollector(bool sizes_known)
    : sizes_known_(sizes_known) {}

model::FileList FileListCollector::collect(util::BoundedQueue<model::FileRecord>& files) {
    model::FileList list;
    list.sizes_known = sizes_known_;

    while (auto record = files.pop()) {
        if (on_record_) {
            on_record_(*record);
        }
        list.total_files++;
        list.total_bytes += record->size;
        list.files.push_back(std::move(*record));
    }

    util::Logger::info("FileListCollector: Collected " + std::to_string(list.total_files) + " files" +
                       (sizes_known_ ? ", " + std::to_string(list.total_bytes) + " bytes" : ""));
    return list;
}

}  // namespace rapidcopy::collectors
