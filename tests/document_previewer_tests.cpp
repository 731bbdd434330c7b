#include <cassert>
#include <chrono>
#include <optional>
#include <string>

#include "preview/document_previewer.hpp"
#include "runtime/main_loop.hpp"
#include "test_support.hpp"

using asyncpath::DocumentPreviewer;
using asyncpath::MainLoop;
using asyncpath::PreviewOutcome;
using asyncpath::testing::TempDir;
using asyncpath::testing::write_file;

namespace {

using namespace std::chrono_literals;

std::string numbered_lines(int count) {
    std::string text;
    for (int i = 1; i <= count; ++i) {
        text += "line " + std::to_string(i) + "\n";
    }
    return text;
}

void test_missing_file_is_a_placeholder() {
    const auto result = DocumentPreviewer::read_preview("/definitely/missing/file.txt", 20);
    assert(result.binary);
    assert(result.placeholder == "cannot read this file");
    assert(result.lines.empty());
}

void test_empty_and_binary_placeholders_differ() {
    TempDir dir("preview_placeholders");
    write_file(dir.path() / "empty", "");
    write_file(dir.path() / "blob", std::string("ab\0cd\n", 6));

    const auto empty = DocumentPreviewer::read_preview((dir.path() / "empty").string(), 20);
    assert(empty.binary);
    assert(empty.placeholder == "empty file");

    const auto blob = DocumentPreviewer::read_preview((dir.path() / "blob").string(), 20);
    assert(blob.binary);
    assert(blob.placeholder == "binary file");
    assert(blob.lines.empty());
}

void test_nul_past_the_window_is_not_seen() {
    TempDir dir("preview_window");
    std::string content(2000, 'a');
    content[1500] = '\0';
    write_file(dir.path() / "late_nul", content);

    const auto result = DocumentPreviewer::read_preview((dir.path() / "late_nul").string(), 20);
    assert(!result.binary);
    assert(result.lines.size() == 1);
    assert(result.lines.front().size() == 1024);
    assert(result.truncated);
}

void test_line_limit_truncates() {
    TempDir dir("preview_limit");
    write_file(dir.path() / "ten.txt", numbered_lines(10));

    const auto result = DocumentPreviewer::read_preview((dir.path() / "ten.txt").string(), 3);
    assert(!result.binary);
    assert(result.lines.size() == 3);
    assert(result.lines[0] == "line 1");
    assert(result.lines[2] == "line 3");
    assert(result.truncated);
}

void test_unbounded_and_exact_fit() {
    TempDir dir("preview_unbounded");
    write_file(dir.path() / "crlf.txt", "one\r\ntwo\r\n\r\nfour");

    const auto all = DocumentPreviewer::read_preview((dir.path() / "crlf.txt").string(), -1);
    assert(!all.binary);
    assert(all.lines.size() == 4);
    assert(all.lines[0] == "one");
    assert(all.lines[2].empty());
    assert(all.lines[3] == "four");
    assert(!all.truncated);

    const auto fit = DocumentPreviewer::read_preview((dir.path() / "crlf.txt").string(), 4);
    assert(fit.lines.size() == 4);
    assert(!fit.truncated);
}

void test_async_preview() {
    TempDir dir("preview_async");
    write_file(dir.path() / "script.sh", "#!/bin/sh\necho hi\n");

    MainLoop loop;
    DocumentPreviewer previewer(loop);

    std::optional<PreviewOutcome> delivered;
    previewer.preview((dir.path() / "script.sh").string(), 20,
                      [&delivered](PreviewOutcome outcome) { delivered = std::move(outcome); });

    assert(loop.run_until([&delivered] { return delivered.has_value(); }, 5s));
    assert(delivered->has_value());
    assert((*delivered)->lines.size() == 2);
    assert((*delivered)->lines[1] == "echo hi");
}

} // namespace

int main() {
    test_missing_file_is_a_placeholder();
    test_empty_and_binary_placeholders_differ();
    test_nul_past_the_window_is_not_seen();
    test_line_limit_truncates();
    test_unbounded_and_exact_fit();
    test_async_preview();
    return 0;
}
