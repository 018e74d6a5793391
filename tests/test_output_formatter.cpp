/**
 * test_output_formatter.cpp - Unit tests for json, text and table rendering
 */

#include "dp/OutputFormatter.hpp"

#include <cassert>
#include <iostream>

using json = nlohmann::json;

namespace {

dp::Result notFound() {
    return dp::Result::fail(dp::ErrorKind::NOT_FOUND, "Site 'my-blog' not found",
                            {"create site named my-blog"}, {{"site", "my-blog"}});
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

void test_json_output() {
    dp::OutputFormatter formatter;
    auto result = notFound();

    std::string out = formatter.render(result, dp::OutputFormat::JSON);

    assert(out == dp::dumpJson(result.toJson(), 2));
    assert(contains(out, "\"error\": \"NotFoundFailure\""));
    assert(json::parse(out)["data"]["suggestions"][0] == "create site named my-blog");

    auto ok = dp::Result::ok("done");
    assert(!json::parse(formatter.render(ok, dp::OutputFormat::JSON)).contains("error"));

    std::cout << "[PASS] test_json_output\n";
}

void test_text_output() {
    dp::OutputFormatter formatter(false);

    std::string failed = formatter.render(notFound(), dp::OutputFormat::TEXT);
    assert(contains(failed, "✘ Site 'my-blog' not found [NotFoundFailure]"));
    assert(contains(failed, "   site: my-blog"));
    assert(contains(failed, "Suggestions:\n   - create site named my-blog"));
    assert(!contains(failed, "\033["));
    assert(failed.back() != '\n');

    auto ok = dp::Result::ok("Site started", {{"url", "https://my-blog.ddev.site"}});
    std::string good = formatter.render(ok, dp::OutputFormat::TEXT);
    assert(good.rfind("✔ Site started", 0) == 0);
    assert(contains(good, "   url: https://my-blog.ddev.site"));

    dp::OutputFormatter colored(true);
    assert(contains(colored.render(ok, dp::OutputFormat::TEXT), "\033[32m"));

    std::cout << "[PASS] test_text_output\n";
}

void test_table_output() {
    dp::OutputFormatter formatter;
    auto ok = dp::Result::ok("Site started", {{"platform", "ddev"}});

    std::string table = formatter.render(ok, dp::OutputFormat::TABLE);

    assert(table.rfind("Status              : SUCCESS\n", 0) == 0);
    assert(contains(table, "Message             : Site started"));
    assert(contains(table, std::string(50, '-')));
    assert(contains(table, "platform            : ddev"));
    assert(table.back() != '\n');

    std::string failed = formatter.render(notFound(), dp::OutputFormat::TABLE);
    assert(contains(failed, ": FAILED"));
    assert(contains(failed, "Error               : NotFoundFailure"));

    std::cout << "[PASS] test_table_output\n";
}

void test_format_value() {
    assert(dp::OutputFormatter::formatValue("plain") == "plain");
    assert(dp::OutputFormatter::formatValue(json::array({"a", 1, true})) == "a, 1, true");
    assert(dp::OutputFormatter::formatValue(json{{"web", "running"}}) == "{\"web\":\"running\"}");
    assert(dp::OutputFormatter::formatValue(nullptr).empty());
    assert(dp::OutputFormatter::formatValue(42) == "42");

    std::cout << "[PASS] test_format_value\n";
}

void test_invalid_utf8_is_replaced() {
    dp::OutputFormatter formatter(false);
    auto result = dp::Result::fail(dp::ErrorKind::PARSE, "Could not interpret: caf\xe9",
                                   {}, {{"raw_command", "caf\xe9 \xff"}});

    std::string out = formatter.render(result, dp::OutputFormat::JSON);
    auto parsed = json::parse(out);
    assert(parsed["message"] == "Could not interpret: caf\xef\xbf\xbd");

    assert(contains(formatter.render(result, dp::OutputFormat::TABLE), "raw_command"));
    assert(contains(formatter.render(result, dp::OutputFormat::TEXT), "Could not interpret"));

    assert(dp::dumpJson("ok\xc3") == "\"ok\xef\xbf\xbd\"");
    assert(dp::OutputFormatter::formatValue(json{{"k", "\xff"}}) == "{\"k\":\"\xef\xbf\xbd\"}");

    std::cout << "[PASS] test_invalid_utf8_is_replaced\n";
}

void test_parse_output_format() {
    dp::OutputFormat format = dp::OutputFormat::JSON;
    assert(dp::parseOutputFormat("table", format));
    assert(format == dp::OutputFormat::TABLE);
    assert(dp::parseOutputFormat("text", format));
    assert(format == dp::OutputFormat::TEXT);
    assert(!dp::parseOutputFormat("xml", format));
    assert(format == dp::OutputFormat::TEXT);

    std::cout << "[PASS] test_parse_output_format\n";
}

int main() {
    std::cout << "Running OutputFormatter tests...\n\n";

    test_json_output();
    test_text_output();
    test_table_output();
    test_format_value();
    test_invalid_utf8_is_replaced();
    test_parse_output_format();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
