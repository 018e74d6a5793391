/**
 * test_parameter_extractor.cpp - Unit tests for ParameterExtractor and the text normalizers
 */

#include "dp/ParameterExtractor.hpp"

#include <cassert>
#include <iostream>

void test_extract_integer() {
    dp::ParameterExtractor extractor;

    assert(extractor.extractInteger("42") == 42L);
    assert(extractor.extractInteger(" #7 ") == 7L);
    assert(!extractor.extractInteger("seven"));
    assert(!extractor.extractInteger(""));

    std::cout << "[PASS] test_extract_integer\n";
}

void test_extract_quoted() {
    dp::ParameterExtractor extractor;

    assert(extractor.extractQuoted("'Hello World' please") == "Hello World");
    assert(extractor.extractQuoted("\"Release notes\"") == "Release notes");
    // An apostrophe inside a word is not a quote
    assert(extractor.extractQuoted("don't   stop") == "don't stop");

    std::cout << "[PASS] test_extract_quoted\n";
}

void test_extract_free_text() {
    dp::ParameterExtractor extractor;

    assert(extractor.extractFreeText("about AI in Drupal using openai") == "AI in Drupal");
    assert(extractor.extractFreeText("drupal security?") == "drupal security");

    std::cout << "[PASS] test_extract_free_text\n";
}

void test_vocabulary() {
    dp::ParameterExtractor extractor;
    const std::vector<std::string> types = {"article", "page"};

    assert(extractor.matchVocabulary("Pages", types) == "page");
    assert(extractor.matchVocabulary("blog", types) == "blog");

    assert(extractor.findVocabularyWord("show me the latest pages", types) == std::string("page"));
    assert(!extractor.findVocabularyWord("a paged result", {"page"}));
    // Earliest mention wins
    assert(extractor.findVocabularyWord("use gemini not openai", {"openai", "gemini"}) ==
           std::string("gemini"));

    std::cout << "[PASS] test_vocabulary\n";
}

void test_split_list() {
    dp::ParameterExtractor extractor;

    auto items = extractor.splitList("drupal, php; news |  ");
    assert(items.size() == 3);
    assert(items[0] == "drupal");
    assert(items[1] == "php");
    assert(items[2] == "news");

    std::cout << "[PASS] test_split_list\n";
}

void test_extract_roles() {
    dp::ParameterExtractor extractor;

    dp::ParamRole count;
    count.name = "count";
    count.kind = dp::RoleKind::INTEGER;
    count.group = 1;
    count.mandatory = false;
    count.fallback = 10;

    dp::ParamRole site;
    site.name = "project_name";
    site.kind = dp::RoleKind::IDENTIFIER;
    site.group = 2;

    auto extraction = extractor.extract("latest posts", {"latest posts", "", ""}, {count, site});
    assert(extraction.parameters["count"] == 10);
    assert(!extraction.complete());
    assert(extraction.missing.size() == 1);
    assert(extraction.missing[0] == "project_name");

    extraction = extractor.extract("latest 3 posts of 'my-blog'", {"", "3", "'my-blog'"}, {count, site});
    assert(extraction.complete());
    assert(extraction.parameters["count"] == 3);
    assert(extraction.parameters["project_name"] == "my-blog");

    std::cout << "[PASS] test_extract_roles\n";
}

void test_normalizers() {
    assert(dp::cleanText("  too   many\tspaces ") == "too many spaces");
    assert(dp::topicToTitle("AI in drupal") == "Ai In Drupal");
    assert(dp::filenameToTitle("/tmp/hero_banner-image.jpg") == "Hero Banner Image");
    assert(dp::cleanProjectName("My Blog!") == "my-blog");
    assert(dp::cleanProjectName("  shop__2 ") == "shop-2");

    std::cout << "[PASS] test_normalizers\n";
}

void test_html_paragraphs() {
    assert(dp::toHtmlParagraphs("First para.\n\nSecond   para.") == "<p>First para.</p><p>Second para.</p>");
    assert(dp::toHtmlParagraphs("<h2>Kept</h2>") == "<h2>Kept</h2>");

    std::cout << "[PASS] test_html_paragraphs\n";
}

void test_clamp_limit() {
    assert(dp::clampLimit(0) == 1);
    assert(dp::clampLimit(5) == 5);
    assert(dp::clampLimit(500) == 100);

    std::cout << "[PASS] test_clamp_limit\n";
}

int main() {
    std::cout << "Running ParameterExtractor tests...\n\n";

    test_extract_integer();
    test_extract_quoted();
    test_extract_free_text();
    test_vocabulary();
    test_split_list();
    test_extract_roles();
    test_normalizers();
    test_html_paragraphs();
    test_clamp_limit();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
