// LineScanner.cpp – Line-at-a-time reader with end-of-input signalling.

#include "EpicsArchiveConfig/LineScanner.hpp"
#include "EpicsArchiveConfig/Errors.hpp"

#include <utility>

namespace archcfg {

LineScanner::LineScanner(std::unique_ptr<std::ifstream> owned, std::filesystem::path path)
    : owned_(std::move(owned)), in_(owned_.get()), path_(std::move(path)) {}

LineScanner LineScanner::open(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open())
        throw IoError("cannot open input file '" + path.string() + "'");
    return LineScanner(std::move(file), path);
}

std::optional<std::string> LineScanner::next() {
    if (done_) return std::nullopt;

    std::string line;
    if (!std::getline(*in_, line)) {
        if (in_->bad()) {
            throw IoError("read error on " +
                          (path_.empty() ? std::string("input stream")
                                         : "'" + path_.string() + "'") +
                          " after line " + std::to_string(line_no_));
        }
        done_ = true;
        return std::nullopt;
    }

    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    ++line_no_;
    return line;
}

} // namespace archcfg
