#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace folio::text {

/**
 * Character formatting carried by a run. heading_level is 0 for body
 * text and 1..3 for heading lines.
 */
struct TextAttributes {
    bool bold = false;
    bool italic = false;
    bool strikethrough = false;
    bool underline = false;
    bool highlight = false;
    std::string link;
    int heading_level = 0;

    bool operator==(const TextAttributes&) const = default;

    [[nodiscard]] bool is_plain() const { return *this == TextAttributes{}; }
};

/**
 * A maximal span of text sharing one attribute set.
 */
struct FormattedRun {
    std::string text;
    TextAttributes attrs;

    bool operator==(const FormattedRun&) const = default;
};

using RunList = std::vector<FormattedRun>;

/**
 * Drops empty runs and merges neighbours with equal attributes.
 */
[[nodiscard]] RunList normalize_runs(RunList runs);

/**
 * Appends text to the last run when the attributes match, otherwise
 * starts a new one.
 */
void append_run(RunList& runs, std::string_view text, const TextAttributes& attrs);

[[nodiscard]] std::string plain_text(const RunList& runs);

/**
 * Splits runs at '\n'. Each element is one line without its newline.
 */
[[nodiscard]] std::vector<RunList> split_lines(const RunList& runs);

/**
 * Point size used for a heading level when rendering (24/18/14), or the
 * body size for level 0.
 */
[[nodiscard]] double heading_point_size(int heading_level, double body_size = 12.0) noexcept;

} // namespace folio::text
