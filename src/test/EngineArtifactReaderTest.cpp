#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "application/PipelineConfig.hpp"
#include "infrastructure/EngineArtifactReader.hpp"
#include "infrastructure/EngineArtifactScanner.hpp"

namespace fs = std::filesystem;
using namespace finfacts::domain;
using finfacts::infrastructure::EngineArtifactReader;
using finfacts::infrastructure::EngineArtifactScanner;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

bool HasWarningContaining(const DocumentContent& content, const std::string& needle) {
    for (const auto& warning : content.warnings) {
        if (warning.find(needle) != std::string::npos) return true;
    }
    return false;
}

void TestHtmlTable() {
    auto matrix = EngineArtifactReader::ParseHtmlTable(
        "<p>x</p><table border=\"1\"><tr><th rowspan=\"2\">项目</th><td colspan='2'>B&amp;C<br/>D</td></tr>"
        "<tr><td>1</td><td>2</td></tr></table>");
    assert(matrix.size() == 2);
    assert(matrix[0].size() == 2 && matrix[1].size() == 2);
    assert(matrix[0][0].isHeader && matrix[0][0].rowSpan == 2);
    assert(!matrix[0][1].isHeader && matrix[0][1].colSpan == 2);
    assert(matrix[0][1].text == "B&C D");
    assert(matrix[1][1].text == "2");

    auto clamped = EngineArtifactReader::ParseHtmlTable("<table><tr><td colspan=\"99999\">x</td></tr></table>");
    assert(clamped[0][0].colSpan == 1000);

    assert(EngineArtifactReader::HtmlCellText(" <b>1,000</b>&nbsp;") == "1,000");
    assert(EngineArtifactReader::ParseHtmlTable("no table here").empty());
    std::cout << "[PASS] HTML tables parse with spans." << std::endl;
}

void TestContentList(const fs::path& root) {
    const fs::path file = root / "cl" / "report_content_list.json";
    WriteFile(file, R"([
        {"type": "text", "text": "公司简介", "page_idx": 0},
        {"type": "text", "text": "合并资产负债表", "text_level": 1, "page_idx": 2},
        {"type": "table", "page_idx": 2, "table_footnote": ["单位：元"],
         "table_body": "<table><tr><th>项目</th><th>期末余额</th></tr><tr><td>货币资金</td><td>1,000</td></tr></table>"},
        {"type": "chart", "page_idx": 2},
        {"type": "table", "page_idx": 3, "table_caption": ["母公司利润表"], "table_body": ""}
    ])");

    finfacts::application::PipelineConfig config;
    EngineArtifactReader reader(config.knownElementTypes);
    auto content = reader.read({{file.string(), ArtifactKind::ContentList, 0}});

    assert(content.tables.size() == 1);
    const auto& table = content.tables.front();
    assert(table.page == 3);
    assert(table.kind == PageArtifactKind::Matrix);
    assert(table.caption == "合并资产负债表");
    assert(table.context == "单位：元");
    assert(table.matrix.size() == 2 && table.matrix[0][0].isHeader);
    assert(content.pageCount == 4);
    assert(content.pageText.at(1) == "公司简介");
    assert(HasWarningContaining(content, "unknown content-list elements"));
    assert(HasWarningContaining(content, "table without body on page 4"));
    std::cout << "[PASS] Content lists yield captioned tables and page text." << std::endl;
}

void TestLayoutText(const fs::path& root) {
    const fs::path file = root / "layout" / "report.layout.txt";
    WriteFile(file, "第一页\n项目      本期\f营业收入    100\n营业成本    60\n\f");

    EngineArtifactReader reader;
    auto content = reader.read({{file.string(), ArtifactKind::LayoutText, 0}});
    assert(content.pageCount == 2);
    assert(content.tables.size() == 2);
    assert(content.tables[1].page == 2);
    assert(content.tables[1].kind == PageArtifactKind::TextLines);
    assert(content.tables[1].lines.size() == 2);
    assert(content.tables[1].lines[0].fragments.size() == 2);
    std::cout << "[PASS] Layout text splits on form feeds." << std::endl;
}

void TestMarkdown(const fs::path& root) {
    const fs::path file = root / "md" / "page_5.md";
    WriteFile(file, "# 合并利润表\n\n<table><tr><td>营业收入</td><td>100</td></tr></table>\n注：金额单位为元\n\n后续正文\n");

    EngineArtifactReader reader;
    auto content = reader.read({{file.string(), ArtifactKind::Markdown, 0}});
    assert(content.tables.size() == 1);
    assert(content.tables[0].page == 5);
    assert(content.tables[0].caption == "合并利润表");
    assert(content.tables[0].context.find("注：金额单位为元") == 0);
    assert(content.pageCount == 5);
    std::cout << "[PASS] Markdown pages keep their page number and caption." << std::endl;
}

void TestUnreadableArtifact(const fs::path& root) {
    EngineArtifactReader reader;
    auto content = reader.read({{(root / "missing_content_list.json").string(), ArtifactKind::ContentList, 0}});
    assert(content.tables.empty());
    assert(HasWarningContaining(content, "cannot read"));
    std::cout << "[PASS] Unreadable artifacts become warnings." << std::endl;
}

void TestScanner(const fs::path& root) {
    WriteFile(root / "scan" / "report" / "auto" / "report_content_list.json", "[]");
    WriteFile(root / "scan" / "report" / "auto" / "report.md", "text");
    WriteFile(root / "scan" / "engine.log", "log");

    EngineArtifactScanner nested((root / "scan").string(), false);
    auto found = nested.scan("report");
    assert(found.size() == 1);
    assert(found[0].kind == ArtifactKind::ContentList);

    WriteFile(root / "flat" / "other.md", "other");
    WriteFile(root / "flat" / "report.layout.txt", "x");
    EngineArtifactScanner flat((root / "flat").string(), false);
    auto flatFound = flat.scan("report");
    assert(flatFound.size() == 1);
    assert(flatFound[0].kind == ArtifactKind::LayoutText);

    EngineArtifactScanner empty((root / "nothing").string(), true);
    assert(empty.scan("report").empty());

    assert(EngineArtifactScanner::ClassifyByName("Report_Content_List.JSON") == ArtifactKind::ContentList);
    assert(EngineArtifactScanner::ClassifyByName("mineru.log") == ArtifactKind::Unknown);
    std::cout << "[PASS] Scanner prefers the best artifact kind." << std::endl;
}

void TestSharedDirectoryIgnoresForeignFiles(const fs::path& root) {
    WriteFile(root / "shared" / "other.md", "other");
    WriteFile(root / "shared" / "other_content_list.json", "[]");

    EngineArtifactScanner shared((root / "shared").string(), false);
    assert(shared.scan("report").empty());

    EngineArtifactScanner exclusive((root / "shared").string(), true);
    auto owned = exclusive.scan("report");
    assert(owned.size() == 1);
    assert(owned[0].kind == ArtifactKind::ContentList);

    WriteFile(root / "run" / "document.layout.txt", "x");
    EngineArtifactScanner perRun((root / "run").string(), true);
    auto layout = perRun.scan("report");
    assert(layout.size() == 1);
    assert(layout[0].kind == ArtifactKind::LayoutText);
    std::cout << "[PASS] Shared directories only yield files named after the document." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EngineArtifactReader Test..." << std::endl;

    const fs::path root = "test_artifacts_root";
    fs::remove_all(root);
    fs::create_directories(root);

    TestHtmlTable();
    TestContentList(root);
    TestLayoutText(root);
    TestMarkdown(root);
    TestUnreadableArtifact(root);
    TestScanner(root);
    TestSharedDirectoryIgnoresForeignFiles(root);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
