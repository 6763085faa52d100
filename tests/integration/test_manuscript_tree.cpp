#include <catch2/catch_test_macros.hpp>

#include "cli/manuscript_tree.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace folio;
using namespace folio::cli;

namespace {

Manuscript sample() {
    auto m = create_manuscript("Night", "A. Writer");
    m.labels = {{"l1", "Chapter", "#4A90D9"}};
    m.statuses = {{"s1", "Draft"}};

    auto b = create_document("Second", "two words", 1);
    b.include_in_compile = false;
    auto a = create_document("First", "one", 0);
    a.label_id = "l1";
    a.status_id = "s1";
    a.keywords = {"night"};
    m.draft.documents = {b, a};

    auto part = create_folder("Part", FolderKind::Subfolder, 0);
    part.documents.push_back(create_document("Inner", "", 0));
    m.draft.subfolders.push_back(part);

    m.research = create_folder("Research", FolderKind::Research);
    return m;
}

} // namespace

TEST_CASE("format_manuscript_tree: outline", "[cli]") {
    const auto m = sample();
    REQUIRE(format_manuscript_tree(m) ==
            "Night by A. Writer\n"
            "- Draft/\n"
            "  - First [label: Chapter, status: Draft]\n"
            "  - Second [excluded]\n"
            "  - Part/\n"
            "    - Inner\n"
            "- Research/\n");

    SECTION("word counts and ids") {
        const auto tree = format_manuscript_tree(m, {.include_ids = true, .include_word_counts = true});
        REQUIRE(tree.contains(QStringLiteral("Second (") + QString::fromStdString(m.draft.documents[0].id.to_string()) +
                              QStringLiteral(") [excluded, 2 words]")));
    }
}

TEST_CASE("manuscript_to_json", "[cli]") {
    const auto json = manuscript_to_json(sample());
    REQUIRE(json.value("title").toString() == "Night");

    const auto folders = json.value("folders").toArray();
    REQUIRE(folders.size() == 2);
    const auto draft = folders[0].toObject();
    REQUIRE(draft.value("kind").toString() == "draft");
    REQUIRE_FALSE(draft.contains("id"));

    const auto first = draft.value("documents").toArray()[0].toObject();
    REQUIRE(first.value("title").toString() == "First");
    REQUIRE(first.value("label").toString() == "Chapter");
    REQUIRE(first.value("status").toString() == "Draft");
    REQUIRE(first.value("keywords").toArray() == QJsonArray{"night"});
    REQUIRE(first.value("includeInCompile").toBool());

    REQUIRE(draft.value("subfolders").toArray()[0].toObject().value("kind").toString() == "subfolder");
    REQUIRE(folders[1].toObject().value("kind").toString() == "research");

    SECTION("compact text form parses back") {
        const auto text = format_manuscript_tree_json(sample());
        REQUIRE(text.endsWith('\n'));
        REQUIRE(QJsonDocument::fromJson(text.toUtf8()).object().value("author").toString() == "A. Writer");
    }
}

TEST_CASE("format_report and report_to_json", "[cli]") {
    OperationReport report;
    report.documents = 3;
    report.folders = 1;
    report.warn("Photo", "media item skipped", Severity::Info);
    report.warn("Scene", "label 9 is not declared; dropped");

    REQUIRE(format_report(report) ==
            "3 documents, 1 folder, 1 warning\n"
            "  [info] Photo: media item skipped\n"
            "  [warning] Scene: label 9 is not declared; dropped\n");

    const auto json = report_to_json(report);
    REQUIRE(json.value("documents").toInteger() == 3);
    REQUIRE(json.value("warnings").toArray().size() == 2);
    REQUIRE(json.value("warnings").toArray()[1].toObject().value("severity").toString() == "warning");
}
