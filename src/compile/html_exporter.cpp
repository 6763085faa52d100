#include "compile/html_exporter.hpp"

#include "compile/cmark_html.hpp"
#include "compile/markdown_exporter.hpp"
#include "text/xml_escape.hpp"

#include <cstdio>

namespace folio::compile {

std::string css_font_stack(FontStyle style) {
    switch (style) {
        case FontStyle::Serif: return "Georgia, 'Times New Roman', serif";
        case FontStyle::SansSerif: return "'Helvetica Neue', Helvetica, Arial, sans-serif";
        case FontStyle::Monospace: return "Menlo, Monaco, 'Courier New', monospace";
    }
    return "serif";
}

std::string compile_html(const CompileJob& job, ProgressReporter& progress) {
    const auto body = render_markdown_html(compile_markdown(job, progress, {.front_matter = false, .title_block = false}));
    const auto title = text::escape_xml(job.title);

    char metrics[96];
    std::snprintf(metrics, sizeof(metrics), "font-size: %gpt;\n            line-height: %g;",
                  job.settings.font_size, job.settings.line_spacing);

    std::string html;
    html += "<!doctype html>\n<html lang=\"en\">\n<head>\n";
    html += "    <meta charset=\"utf-8\">\n";
    html += "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n";
    html += "    <title>" + title + "</title>\n";
    html += "    <style>\n";
    html += "        body {\n            font-family: " + css_font_stack(job.settings.font_style) + ";\n            ";
    html += metrics;
    html += "\n            margin: 40px;\n            color: #111;\n        }\n";
    html += "        h1, h2, h3, h4, h5, h6 { margin-top: 1.6em; }\n";
    html += "        hr { margin: 2em 0; }\n";
    html += "        .manuscript-author { color: #555; font-style: italic; margin-bottom: 2em; }\n";
    html += "    </style>\n</head>\n<body>\n";
    html += "<h1>" + title + "</h1>\n";
    if (!job.author.empty()) {
        html += "<div class=\"manuscript-author\">by " + text::escape_xml(job.author) + "</div>\n";
    }
    html += body;
    html += "</body>\n</html>\n";
    return html;
}

Res<QByteArray> HtmlExporter::render(const CompileJob& job, ProgressReporter& progress) const {
    return Res<QByteArray>::ok(to_bytes(compile_html(job, progress)));
}

} // namespace folio::compile
