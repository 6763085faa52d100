#include "text/rich_text.hpp"

namespace folio::text {

RunList normalize_runs(RunList runs) {
    RunList out;
    out.reserve(runs.size());
    for (auto& run : runs) {
        if (run.text.empty()) {
            continue;
        }
        if (!out.empty() && out.back().attrs == run.attrs) {
            out.back().text += run.text;
        } else {
            out.push_back(std::move(run));
        }
    }
    return out;
}

void append_run(RunList& runs, std::string_view text, const TextAttributes& attrs) {
    if (text.empty()) return;
    if (!runs.empty() && runs.back().attrs == attrs) {
        runs.back().text.append(text);
        return;
    }
    runs.push_back(FormattedRun{std::string(text), attrs});
}

std::string plain_text(const RunList& runs) {
    std::string out;
    for (const auto& run : runs) out += run.text;
    return out;
}

std::vector<RunList> split_lines(const RunList& runs) {
    std::vector<RunList> lines(1);
    for (const auto& run : runs) {
        std::string_view rest(run.text);
        while (true) {
            const auto nl = rest.find('\n');
            if (nl == std::string_view::npos) {
                append_run(lines.back(), rest, run.attrs);
                break;
            }
            append_run(lines.back(), rest.substr(0, nl), run.attrs);
            lines.emplace_back();
            rest.remove_prefix(nl + 1);
        }
    }
    return lines;
}

double heading_point_size(int heading_level, double body_size) noexcept {
    switch (heading_level) {
        case 1: return 24.0;
        case 2: return 18.0;
        case 3: return 14.0;
        default: return body_size;
    }
}

} // namespace folio::text
