#include <cf/failure_path.h>

namespace cf {

namespace {
    const std::string segment_prefix = "Failed at '";
    const std::string segment_suffix = "': ";
}

FailurePath split_failure_path(const std::string& reason) {
    FailurePath path;
    size_t pos = 0;
    while (reason.compare(pos, segment_prefix.size(), segment_prefix) == 0) {
        size_t key_start = pos + segment_prefix.size();
        size_t key_end = reason.find(segment_suffix, key_start);
        if (key_end == std::string::npos) break;
        path.segments.push_back(reason.substr(key_start, key_end - key_start));
        pos = key_end + segment_suffix.size();
    }
    path.reason = reason.substr(pos);
    return path;
}

std::string display_path(const std::vector<std::string>& segments) {
    if (segments.empty()) return std::string("root");
    std::string out;
    for (auto const& s : segments) {
        if (!out.empty()) out.push_back('/');
        out.append(s);
    }
    return out;
}

}  // namespace cf
