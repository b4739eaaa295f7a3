/// @file test_document_io.cpp
/// @brief Unit tests for load_file, save_file and Editor::load/save.

#include <treedit/treedit.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace treedit;

namespace {

namespace fs = std::filesystem;

/// Temporary file removed on destruction.
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_(fs::temp_directory_path() / ("treedit_" + name)) {}
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

    void write(const std::string& content) const {
        std::ofstream ofs(path_, std::ios::binary);
        ofs << content;
    }

    std::string read() const {
        std::ifstream ifs(path_, std::ios::binary);
        std::ostringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

private:
    fs::path path_;
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// load_file / save_file
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DocumentIo, LoadParsesWholeFile) {
    TempFile f("load.json");
    f.write("{\n  \"b\": [1, 2],\n  \"a\": null\n}\n");
    Node doc = load_file(f.path());
    EXPECT_EQ(doc.as_object().keys(), (std::vector<std::string>{"b", "a"}));
}

TEST(DocumentIo, LoadHonoursParseOptions) {
    TempFile f("lenient.json");
    f.write("// settings\n{a: 1,}\n");
    EXPECT_THROW((void)load_file(f.path()), FormatError);
    EXPECT_EQ(load_file(f.path(), ParseOptions::lenient())["a"].as_integer(), 1);
}

TEST(DocumentIo, MissingFileIsIoError) {
    try {
        (void)load_file("/nonexistent/dir/treedit.json");
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.code(), errc::file_open_failed);
    }
}

TEST(DocumentIo, SaveWritesPrintedTextAndNewline) {
    TempFile f("save.json");
    save_file(f.path(), parse(R"({"k":[1]})"));
    EXPECT_EQ(f.read(), "{\n  \"k\": [\n    1\n  ]\n}\n");

    save_file(f.path(), parse(R"({"k":[1]})"), SerializeOptions::compact());
    EXPECT_EQ(f.read(), "{\"k\":[1]}\n");
}

TEST(DocumentIo, SaveToMissingDirectoryIsIoError) {
    EXPECT_THROW(save_file("/nonexistent/dir/out.json", Node(1)), IoError);
}

TEST(DocumentIo, SaveThenLoadKeepsDocument) {
    TempFile f("roundtrip.json");
    const Node doc = parse(R"({"z": {"y": [1.5, "s", true]}, "a": -3})");
    save_file(f.path(), doc);
    EXPECT_EQ(load_file(f.path()), doc);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Editor
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DocumentIo, EditorLoadResetsHistory) {
    TempFile f("editor.json");
    f.write(R"({"a": 1})");

    Editor ed(parse("[]"));
    ed.add_child(Path{});
    std::vector<std::string> ops;
    ed.set_listener([&](std::string_view op, const std::vector<TreeEntry>&) {
        ops.emplace_back(op);
    });

    ed.load(f.path());
    EXPECT_EQ(ed.document(), parse(R"({"a": 1})"));
    EXPECT_FALSE(ed.can_undo());
    EXPECT_EQ(ops, std::vector<std::string>{"load"});
}

TEST(DocumentIo, EditorLoadFailureKeepsDocument) {
    TempFile f("broken.json");
    f.write("{\"a\": ");

    Editor ed(parse("[1]"));
    ed.add_child(Path{});
    EXPECT_THROW(ed.load(f.path()), FormatError);
    EXPECT_EQ(ed.document(), parse(R"([1, ""])"));
    EXPECT_TRUE(ed.can_undo());
}

TEST(DocumentIo, EditorSaveUsesPrintOptions) {
    TempFile f("editor_save.json");
    EditorOptions opts;
    opts.print.indent = 4;
    Editor ed(parse(R"({"a": 1})"), opts);
    ed.save(f.path());
    EXPECT_EQ(f.read(), "{\n    \"a\": 1\n}\n");
}
