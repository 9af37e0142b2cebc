#include <gtest/gtest.h>
#include <regex>
#include "application_record.hpp"
#include "text_utils.hpp"

using namespace app_retrieval;
using json = nlohmann::json;

// ─── Identity ─────────────────────────────────────────────────

TEST(ApplicationRecordTest, Slug) {
    EXPECT_EQ(slug("  Google DeepMind "), "google-deepmind");
    EXPECT_EQ(slug("Sr. ML Engineer (NLP)"), "sr-ml-engineer-nlp");
    EXPECT_EQ(slug("***"), "unknown");
    EXPECT_EQ(slug(""), "unknown");
}

TEST(ApplicationRecordTest, StableIdFormat) {
    std::string id = stable_id("DeepMind", "ML Engineer", "https://jobs.ashbyhq.com/deepmind/1");
    EXPECT_TRUE(std::regex_match(id, std::regex(R"(deepmind__ml-engineer__[0-9a-f]{10})"))) << id;
    EXPECT_EQ(id, stable_id(" DeepMind", "ML Engineer ", " https://jobs.ashbyhq.com/deepmind/1 "));
    EXPECT_NE(id, stable_id("DeepMind", "ML Engineer", "https://jobs.ashbyhq.com/deepmind/2"));
}

// ─── Field parsing ────────────────────────────────────────────

TEST(ApplicationRecordTest, ParseTags) {
    EXPECT_EQ(parse_tags("ai; ml ;;  infra "), (std::vector<std::string>{"ai", "ml", "infra"}));
    EXPECT_TRUE(parse_tags("").empty());
    EXPECT_TRUE(parse_tags(" ; ").empty());
}

TEST(ApplicationRecordTest, NormalizeStatus) {
    EXPECT_EQ(normalize_status("applied"), "Applied");
    EXPECT_EQ(normalize_status(" In Progress "), "Draft");
    EXPECT_EQ(normalize_status("OFFER"), "Offer");
    EXPECT_EQ(normalize_status(""), "Draft");
    EXPECT_EQ(normalize_status("Phone Screen"), "Phone Screen");
}

TEST(ApplicationRecordTest, InferApplicationMethod) {
    EXPECT_EQ(infer_application_method("https://jobs.ashbyhq.com/acme"), "ashby");
    EXPECT_EQ(infer_application_method("https://boards.greenhouse.io/acme/jobs/1"), "greenhouse");
    EXPECT_EQ(infer_application_method("https://jobs.lever.co/acme"), "lever");
    EXPECT_EQ(infer_application_method("https://acme.wd5.myworkdayjobs.com/x"), "workday");
    EXPECT_EQ(infer_application_method("https://www.LinkedIn.com/jobs/view/1"), "linkedin");
    EXPECT_EQ(infer_application_method("https://work.mercor.com/jobs/1"), "mercor");
    EXPECT_EQ(infer_application_method("https://angel.co/company/acme"), "wellfound");
    EXPECT_EQ(infer_application_method("https://acme.com/careers"), "direct");
    EXPECT_EQ(infer_application_method(""), "direct");
}

// ─── Tracker rows ─────────────────────────────────────────────

TEST(ApplicationRecordTest, RecordFromTrackerRow) {
    json row = {
        {"Company", " DeepMind "},
        {"Role", "ML Engineer"},
        {"Status", "applied"},
        {"Career Page URL", "https://jobs.ashbyhq.com/deepmind/1"},
        {"Tags", "ai; ml"},
        {"Notes", "Referred by a friend"},
        {"Location", "London"},
        {"Salary Range", "150-200k"},
        {"What Worked", "short cover letter"},
        {"Date Applied", "2026-02-01"},
        {"evidence", {"resume_v3.pdf"}}
    };

    auto rec = record_from_tracker_row(row, "2026-02-19T00:00:00+00:00");
    EXPECT_EQ(rec.company, "DeepMind");
    EXPECT_EQ(rec.status, "Applied");
    EXPECT_EQ(rec.application_method, "ashby");
    EXPECT_EQ(rec.tags, (std::vector<std::string>{"ai", "ml"}));
    EXPECT_EQ(rec.app_id, stable_id("DeepMind", "ML Engineer", "https://jobs.ashbyhq.com/deepmind/1"));
    EXPECT_EQ(rec.date_applied, "2026-02-01");
    EXPECT_EQ(rec.updated_at, "2026-02-19T00:00:00+00:00");
    EXPECT_EQ(rec.evidence, (std::vector<std::string>{"resume_v3.pdf"}));

    EXPECT_NE(rec.rag_text.find("Company: DeepMind"), std::string::npos);
    EXPECT_NE(rec.rag_text.find("Tags: ai;ml"), std::string::npos);
    EXPECT_NE(rec.context_bundle_text.find("method=ashby"), std::string::npos);
    EXPECT_NE(rec.context_bundle_text.find("tags=ai ml"), std::string::npos);
    EXPECT_NE(rec.context_bundle_text.find("location=London"), std::string::npos);
    EXPECT_NE(rec.context_bundle_text.find("signals=short cover letter"), std::string::npos);
}

TEST(ApplicationRecordTest, RecordFromTrackerRowRejectsNonObject) {
    EXPECT_THROW(record_from_tracker_row(json::array(), "now"), std::invalid_argument);
}

TEST(ApplicationRecordTest, MissingColumnsFallBack) {
    auto rec = record_from_tracker_row(json{{"Company", "Acme"}}, "now");
    EXPECT_EQ(rec.status, "Draft");
    EXPECT_EQ(rec.application_method, "direct");
    EXPECT_TRUE(rec.tags.empty());
    EXPECT_EQ(rec.app_id.rfind("acme__unknown__", 0), 0u);
}

TEST(ApplicationRecordTest, DedupeKeepsFirst) {
    ApplicationRecord a;
    a.app_id = "x";
    a.company = "First";
    ApplicationRecord b;
    b.app_id = "x";
    b.company = "Second";
    ApplicationRecord c;
    c.app_id = "y";
    ApplicationRecord blank;

    auto out = dedupe_records({a, b, blank, c});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].company, "First");
    EXPECT_EQ(out[1].app_id, "y");
}

// ─── JSON ─────────────────────────────────────────────────────

TEST(ApplicationRecordTest, FromJsonDefaultsAndAliases) {
    json j = {
        {"app_id", "acme__swe__0123456789"},
        {"company", "Acme"},
        {"tags", {"backend", 7, "infra"}},
        {"text", "indexed document"},
        {"artifacts", {{"evidence", {"cover.pdf"}}}}
    };
    auto rec = ApplicationRecord::from_json(j);
    EXPECT_EQ(rec.application_method, "direct");
    EXPECT_EQ(rec.tags, (std::vector<std::string>{"backend", "infra"}));
    EXPECT_EQ(rec.rag_text, "indexed document");
    EXPECT_EQ(rec.evidence, (std::vector<std::string>{"cover.pdf"}));
    EXPECT_TRUE(rec.role.empty());
}

TEST(ApplicationRecordTest, ToJsonCarriesAllFields) {
    ApplicationRecord rec;
    rec.app_id = "acme__swe__0123456789";
    rec.company = "Acme";
    rec.application_method = "lever";
    rec.tags = {"backend"};

    auto j = rec.to_json();
    EXPECT_EQ(j["app_id"], "acme__swe__0123456789");
    EXPECT_EQ(j["application_method"], "lever");
    EXPECT_EQ(j["tags"], json::array({"backend"}));
    EXPECT_TRUE(j.contains("context_bundle_text"));
    EXPECT_TRUE(j.contains("evidence"));
    EXPECT_EQ(ApplicationRecord::from_json(j).company, "Acme");
}

// ─── UTF-8 sanitizing ─────────────────────────────────────────

TEST(SanitizeUtf8Test, KeepsWellFormedText) {
    EXPECT_EQ(sanitize_utf8("plain ascii"), "plain ascii");
    EXPECT_EQ(sanitize_utf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitize_utf8("\xE2\x82\xAC 5"), "\xE2\x82\xAC 5");
    EXPECT_EQ(sanitize_utf8("\xF0\x9F\x91\x8D"), "\xF0\x9F\x91\x8D");
}

TEST(SanitizeUtf8Test, ReplacesMalformedBytes) {
    // Latin-1 byte, stray continuation, invalid lead
    EXPECT_EQ(sanitize_utf8("caf\xE9 \x80\xFF"), "caf? ??");
    // Truncated sequence at the end
    EXPECT_EQ(sanitize_utf8("ab\xE2\x82"), "ab??");
    // Overlong encoding and UTF-16 surrogate
    EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "??");
    EXPECT_EQ(sanitize_utf8("\xED\xA0\x80"), "???");
}

TEST(SanitizeUtf8Test, RecordJsonSerializesMalformedInput) {
    ApplicationRecord rec;
    rec.app_id = "acme__swe__0123456789";
    rec.company = "Caf\xE9 Corp";
    rec.notes = "caf\xE9 \x80\xFF";
    rec.tags = {"ok", "bad\xFF"};

    auto j = rec.to_json();
    EXPECT_EQ(j["company"], "Caf? Corp");
    EXPECT_EQ(j["notes"], "caf? ??");
    EXPECT_EQ(j["tags"][1], "bad?");
    EXPECT_NO_THROW(j.dump());
}
