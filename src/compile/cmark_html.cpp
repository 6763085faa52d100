#include "compile/cmark_html.hpp"

#include <cmark.h>

#include <cstdlib>
#include <optional>
#include <vector>

namespace folio::compile {

namespace {

struct InlineTags {
    const char* open;
    const char* close;
};

struct Span {
    size_t begin = 0; // first marker byte
    size_t end = 0;   // one past the closing marker
    char marker = 0;
};

size_t marker_run(std::string_view s, size_t pos, char c) {
    size_t n = 0;
    while (pos + n < s.size() && s[pos + n] == c) ++n;
    return n;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

// First ~~x~~ or ==x== whose markers are exactly two characters long and
// whose content does not start or end with whitespace.
std::optional<Span> find_span(std::string_view s) {
    for (size_t i = 0; i < s.size();) {
        const char c = s[i];
        if (c != '~' && c != '=') {
            ++i;
            continue;
        }
        const size_t open = marker_run(s, i, c);
        if (open != 2 || i + 2 >= s.size() || is_space(s[i + 2])) {
            i += open;
            continue;
        }
        for (size_t j = i + 3; j < s.size();) {
            if (s[j] != c) {
                ++j;
                continue;
            }
            const size_t close = marker_run(s, j, c);
            if (close == 2 && !is_space(s[j - 1])) {
                return Span{i, j + 2, c};
            }
            j += close;
        }
        i += open;
    }
    return std::nullopt;
}

InlineTags tags_for(char marker, HtmlFlavor flavor) {
    if (marker == '~') {
        return flavor == HtmlFlavor::Web ? InlineTags{"<del>", "</del>"} : InlineTags{"<s>", "</s>"};
    }
    return flavor == HtmlFlavor::Web ? InlineTags{"<mark>", "</mark>"}
                                     : InlineTags{"<span style=\"background-color:#ffff00\">", "</span>"};
}

cmark_node* text_node(std::string_view text) {
    cmark_node* node = cmark_node_new(CMARK_NODE_TEXT);
    cmark_node_set_literal(node, std::string(text).c_str());
    return node;
}

// Replaces `node` by text and custom inline nodes when its literal holds
// marked spans. The content of a span is split again, so ~~==x==~~ nests.
void split_marked_text(cmark_node* node, HtmlFlavor flavor) {
    const char* literal = cmark_node_get_literal(node);
    if (!literal) return;
    const std::string text(literal);
    const auto span = find_span(text);
    if (!span) return;

    const std::string_view view(text);
    if (span->begin > 0) {
        cmark_node_insert_before(node, text_node(view.substr(0, span->begin)));
    }

    const auto tags = tags_for(span->marker, flavor);
    cmark_node* wrapper = cmark_node_new(CMARK_NODE_CUSTOM_INLINE);
    cmark_node_set_on_enter(wrapper, tags.open);
    cmark_node_set_on_exit(wrapper, tags.close);
    cmark_node* inner = text_node(view.substr(span->begin + 2, span->end - span->begin - 4));
    cmark_node_append_child(wrapper, inner);
    cmark_node_insert_before(node, wrapper);
    split_marked_text(inner, flavor);

    if (span->end < view.size()) {
        cmark_node* rest = text_node(view.substr(span->end));
        cmark_node_insert_before(node, rest);
        cmark_node_free(node);
        split_marked_text(rest, flavor);
        return;
    }
    cmark_node_free(node);
}

void mark_inline_spans(cmark_node* doc, HtmlFlavor flavor) {
    std::vector<cmark_node*> texts;
    cmark_iter* iter = cmark_iter_new(doc);
    cmark_event_type ev;
    while ((ev = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
        cmark_node* node = cmark_iter_get_node(iter);
        if (ev == CMARK_EVENT_ENTER && cmark_node_get_type(node) == CMARK_NODE_TEXT) {
            texts.push_back(node);
        }
    }
    cmark_iter_free(iter);

    for (cmark_node* node : texts) {
        split_marked_text(node, flavor);
    }
}

} // namespace

std::string render_markdown_html(std::string_view markdown, HtmlFlavor flavor) {
    cmark_node* doc = cmark_parse_document(markdown.data(), markdown.size(), CMARK_OPT_DEFAULT);
    if (!doc) {
        return {};
    }
    mark_inline_spans(doc, flavor);
    char* html = cmark_render_html(doc, CMARK_OPT_DEFAULT);
    cmark_node_free(doc);
    if (!html) {
        return {};
    }
    std::string out(html);
    free(html);
    return out;
}

} // namespace folio::compile
