#include <gtest/gtest.h>
#include "functions/conversion_options/src/conversion_options.hpp"

#include <filesystem>
#include <fstream>

TEST(ConversionOptionsTest, Defaults) {
    ConversionOptions options;
    EXPECT_EQ(options.document_part, "word/document.xml");
    EXPECT_EQ(options.namespace_uri, "http://schemas.openxmlformats.org/wordprocessingml/2006/main");
    EXPECT_EQ(options.title_suffix, ".docx");
}

TEST(ConversionOptionsTest, LoadEnvSkipsCommentsAndBlankLines) {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "docx2chapter_options_test.env";
    {
        std::ofstream ofs(path);
        ofs << "# import settings\n"
            << "\n"
            << "DOCX_DOCUMENT_PART = word/document2.xml\n"
            << "DOCX_NAMESPACE_URI=\"urn:words\"\n"
            << "not a pair\n"
            << "DOCX_TITLE_SUFFIX=\n";
    }
    auto env = load_env(path.string());
    fs::remove(path);

    EXPECT_EQ(env.size(), 3u);
    EXPECT_EQ(env["DOCX_DOCUMENT_PART"], "word/document2.xml");
    EXPECT_EQ(env["DOCX_NAMESPACE_URI"], "urn:words");

    ConversionOptions options = options_from_env(env);
    EXPECT_EQ(options.document_part, "word/document2.xml");
    EXPECT_EQ(options.namespace_uri, "urn:words");
    EXPECT_EQ(options.title_suffix, "");
}

TEST(ConversionOptionsTest, MissingKeysKeepDefaults) {
    ConversionOptions options = options_from_env({{"UNRELATED", "x"}, {"DOCX_DOCUMENT_PART", ""}});
    EXPECT_EQ(options.document_part, "word/document.xml");
    EXPECT_EQ(options.title_suffix, ".docx");
}

TEST(ConversionOptionsTest, LoadEnvFailsForMissingFile) {
    EXPECT_THROW(load_env("/nonexistent/docx2chapter.env"), std::runtime_error);
}
