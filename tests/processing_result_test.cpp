#include "../libdocmill/include/content_hash.hpp"
#include "../libdocmill/include/processing_result.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace docmill;

TEST(ContentHashTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHashTest, DocumentHashIsDigestPrefix) {
    EXPECT_EQ(document_hash("abc"), "ba7816bf8f01cfea");
    EXPECT_EQ(document_hash("abc").size(), kDocumentHashLength);
    EXPECT_NE(document_hash("abc"), document_hash("abd"));
}

TEST(ProcessingResultTest, FailureJsonCarriesOnlyFailureFields) {
    ProcessingResult r;
    r.success = false;
    r.error_kind = ErrorKind::UnsupportedFormat;
    r.error = "Unsupported format: .xyz";
    r.filename = "data.xyz";
    r.supported_formats = {".pdf", ".txt"};

    const nlohmann::json j = r;

    EXPECT_EQ(j.at("success"), false);
    EXPECT_EQ(j.at("error"), "Unsupported format: .xyz");
    EXPECT_EQ(j.at("error_kind"), "unsupported_format");
    EXPECT_EQ(j.at("filename"), "data.xyz");
    EXPECT_EQ(j.at("supported_formats").size(), 2u);
    EXPECT_FALSE(j.contains("text"));
    EXPECT_FALSE(j.contains("chunks"));
    EXPECT_FALSE(j.contains("install_hint"));
    EXPECT_FALSE(j.contains("file_metadata"));
}

TEST(ProcessingResultTest, SuccessJsonRendersChunksWithContext) {
    ProcessingResult r;
    r.success = true;
    r.filename = "lease.txt";
    r.format = ".txt";
    r.document_type = DocumentType::Contract;
    r.text = "First. Second.";
    r.document_hash = document_hash(r.text);
    r.chunks = {Chunk{0, "", "First."}, Chunk{1, "First.", "Second."}};
    r.processing_stats.chunk_count = 2;
    r.processing_stats.chunking_applied = true;
    FileMetadata meta;
    meta.filename = "lease.txt";
    meta.file_size = 14;
    r.file_metadata = meta;
    DocumentMetadata doc;
    doc.document_type = DocumentType::Contract;
    doc.extracted_entities["legal_sections"] = {"SECTION 1."};
    r.document_metadata = doc;

    const nlohmann::json j = r;

    EXPECT_EQ(j.at("success"), true);
    EXPECT_EQ(j.at("document_type"), "contract");
    EXPECT_EQ(j.at("format"), ".txt");
    ASSERT_EQ(j.at("chunks").size(), 2u);
    EXPECT_EQ(j.at("chunks")[0], "First.");
    EXPECT_EQ(j.at("chunks")[1], "[CONTEXT FROM PREVIOUS SECTION]\nFirst.\n\nSecond.");
    EXPECT_EQ(j.at("processing_stats").at("chunk_count"), 2);
    EXPECT_EQ(j.at("processing_stats").at("chunking_applied"), true);
    EXPECT_EQ(j.at("file_metadata").at("file_size"), 14);
    EXPECT_EQ(j.at("file_metadata").at("mime_type"), "unknown");
    EXPECT_FALSE(j.at("file_metadata").contains("pdf"));
    EXPECT_EQ(j.at("document_metadata").at("extracted_entities").at("legal_sections")[0], "SECTION 1.");
    EXPECT_EQ(j.at("document_metadata").at("language"), "en");
}

TEST(ProcessingResultTest, JsonTextReplacesInvalidUtf8) {
    ProcessingResult r;
    r.error_kind = ErrorKind::FileNotFound;
    r.error = "File not found";
    r.filename = "contrat_r\xE9sili\xE9.txt";

    std::string dumped;
    ASSERT_NO_THROW(dumped = to_json_string(r));

    const auto j = nlohmann::json::parse(dumped);
    EXPECT_EQ(j.at("filename"), "contrat_r\xEF\xBF\xBDsili\xEF\xBF\xBD.txt");
    EXPECT_EQ(j.at("error_kind"), "file_not_found");
}

TEST(ProcessingResultTest, ErrorKindNames) {
    EXPECT_EQ(error_kind_to_string(ErrorKind::None), "none");
    EXPECT_EQ(error_kind_to_string(ErrorKind::NoTextExtracted), "no_text_extracted");
    EXPECT_EQ(error_kind_to_string(ErrorKind::DependencyMissing), "dependency_missing");
    EXPECT_EQ(error_kind_to_string(ErrorKind::Cancelled), "cancelled");
}
