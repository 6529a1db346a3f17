#include <iostream>
#include <string>
#include <vector>
#include "../src/FileSearch.hpp"
#include "../src/ToolError.hpp"
#include "TempTree.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static std::vector<std::string> paths(const std::vector<SearchResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) out.push_back(r.path);
    return out;
}

static ErrorKind failureKind(const FileSearch& search, const SearchRequest& request) {
    try {
        search.search(request);
    } catch (const ToolError& e) {
        return e.kind();
    }
    throw std::runtime_error("expected search for " + request.pattern + " to fail");
}

int main() {
    try {
        TempTree tree("search");
        auto base = tree.mkdir("base");
        PathSanitizer sanitizer(base);
        FileSearch search(sanitizer, 1024);

        tree.write("base/top.txt", "alpha\nneedle here\n");
        tree.write("base/docs/guide.txt", "  needle indented  \nnothing\nanother needle\n");
        tree.write("base/docs/deep/more.txt", "no match in this one\n");
        tree.write("base/docs/readme.md", "needle\n");
        tree.write("base/.hidden.txt", "needle\n");
        tree.write("base/.cache/cached.txt", "needle\n");
        tree.write("base/data/a.csv", "1,2\n");
        tree.write("base/big.txt", std::string(4096, 'n'));
        tree.write("base/bin.txt", std::string("needle\xff\xfe", 8));

        // recursive glob without regex returns every .txt file regardless of content
        SearchRequest all;
        all.pattern = "*.txt";
        auto results = search.search(all);
        std::vector<std::string> expected = {"big.txt", "bin.txt", "docs/deep/more.txt", "docs/guide.txt", "top.txt"};
        ASSERT_TRUE(paths(results) == expected);
        for (const auto& r : results) {
            ASSERT_TRUE(!r.matches);
        }
        ASSERT_TRUE(results[4].size == 18);

        // impossible regex returns nothing even though the files exist
        SearchRequest none = all;
        none.contentRegex = "nomatch_impossible_string";
        ASSERT_TRUE(search.search(none).empty());

        // content search: 1-based line numbers, trimmed content, files without
        // matches excluded, unreadable/oversized files skipped
        SearchRequest needle = all;
        needle.contentRegex = "needle";
        results = search.search(needle);
        ASSERT_TRUE(paths(results) == (std::vector<std::string>{"docs/guide.txt", "top.txt"}));
        ASSERT_TRUE(results[0].matches->size() == 2);
        ASSERT_TRUE((*results[0].matches)[0].lineNumber == 1);
        ASSERT_TRUE((*results[0].matches)[0].content == "needle indented");
        ASSERT_TRUE((*results[0].matches)[1].lineNumber == 3);
        ASSERT_TRUE((*results[1].matches)[0].lineNumber == 2);
        ASSERT_TRUE((*results[1].matches)[0].content == "needle here");

        // regex searches anywhere in the line
        SearchRequest partial = all;
        partial.contentRegex = "ee.l";
        ASSERT_TRUE(search.search(partial).size() == 2);

        // non-recursive only looks at the search directory
        SearchRequest flat = all;
        flat.recursive = false;
        ASSERT_TRUE(paths(search.search(flat)) == (std::vector<std::string>{"big.txt", "bin.txt", "top.txt"}));

        // pattern with a directory component
        SearchRequest nested;
        nested.pattern = "data/*.csv";
        nested.recursive = false;
        ASSERT_TRUE(paths(search.search(nested)) == (std::vector<std::string>{"data/a.csv"}));

        // search_path is relative to the base; results stay relative to the base
        SearchRequest sub;
        sub.pattern = "*.txt";
        sub.searchPath = "docs";
        ASSERT_TRUE(paths(search.search(sub)) == (std::vector<std::string>{"docs/deep/more.txt", "docs/guide.txt"}));
        sub.recursive = false;
        ASSERT_TRUE(paths(search.search(sub)) == (std::vector<std::string>{"docs/guide.txt"}));

        // progress callback covers every candidate
        size_t lastDone = 0, lastTotal = 0;
        search.search(needle, [&](size_t done, size_t total) { lastDone = done; lastTotal = total; });
        ASSERT_TRUE(lastTotal == 5);
        ASSERT_TRUE(lastDone == 5);

        // failures
        SearchRequest badRegex = all;
        badRegex.contentRegex = "([unclosed";
        ASSERT_TRUE(failureKind(search, badRegex) == ErrorKind::InvalidInput);

        SearchRequest escape = all;
        escape.searchPath = "../";
        ASSERT_TRUE(failureKind(search, escape) == ErrorKind::AccessDenied);

        SearchRequest missing = all;
        missing.searchPath = "nope";
        ASSERT_TRUE(failureKind(search, missing) == ErrorKind::NotFound);

        SearchRequest dotdot;
        dotdot.pattern = "../*.txt";
        ASSERT_TRUE(failureKind(search, dotdot) == ErrorKind::InvalidInput);

        SearchRequest absolute;
        absolute.pattern = "/etc/*";
        ASSERT_TRUE(failureKind(search, absolute) == ErrorKind::InvalidInput);

        SearchRequest empty;
        ASSERT_TRUE(failureKind(search, empty) == ErrorKind::InvalidInput);

        // a pattern that names a hidden directory still matches recursively,
        // while plain wildcards keep skipping it
        tree.write("base/.config/app.json", "{}");
        tree.write("base/nested/.config/other.json", "{}");
        SearchRequest dotDir;
        dotDir.pattern = ".config/*.json";
        ASSERT_TRUE(paths(search.search(dotDir)) == (std::vector<std::string>{".config/app.json", "nested/.config/other.json"}));
        dotDir.recursive = false;
        ASSERT_TRUE(paths(search.search(dotDir)) == (std::vector<std::string>{".config/app.json"}));
        SearchRequest anyJson;
        anyJson.pattern = "*.json";
        ASSERT_TRUE(search.search(anyJson).empty());

        // catastrophic backtracking on a long line skips the file instead of
        // taking the process down
        auto longBase = tree.mkdir("longline");
        tree.write("longline/long.txt", std::string(20000, 'a') + "\n");
        tree.write("longline/short.txt", "abc\n");
        PathSanitizer longSanitizer(longBase);
        FileSearch uncapped(longSanitizer, 0);
        SearchRequest backtrack;
        backtrack.pattern = "*.txt";
        backtrack.contentRegex = "(a|b)*c";
        results = uncapped.search(backtrack);
        ASSERT_TRUE(paths(results) == (std::vector<std::string>{"short.txt"}));
        ASSERT_TRUE((*results[0].matches)[0].content == "abc");

        // a file that disappears after the walk is dropped, not reported
        // with a bogus size
        auto vanishBase = tree.mkdir("vanish");
        tree.write("vanish/a.txt", "a");
        tree.write("vanish/b.txt", "b");
        PathSanitizer vanishSanitizer(vanishBase);
        FileSearch vanishSearch(vanishSanitizer, 0);
        SearchRequest both;
        both.pattern = "*.txt";
        results = vanishSearch.search(both, [&](size_t done, size_t) {
            if (done == 1) std::filesystem::remove(vanishBase / "b.txt");
        });
        ASSERT_TRUE(paths(results) == (std::vector<std::string>{"a.txt"}));
        ASSERT_TRUE(results[0].size == 1);

        // unreadable subdirectories do not abort the walk
        auto lockedBase = tree.mkdir("locked");
        tree.write("locked/open.txt", "x");
        tree.write("locked/closed/inside.txt", "x");
        std::filesystem::permissions(lockedBase / "closed", std::filesystem::perms::none);
        PathSanitizer lockedSanitizer(lockedBase);
        FileSearch lockedSearch(lockedSanitizer, 0);
        SearchRequest lockedRequest;
        lockedRequest.pattern = "*.txt";
        results = lockedSearch.search(lockedRequest);
        std::filesystem::permissions(lockedBase / "closed", std::filesystem::perms::owner_all);
        bool sawOpen = false;
        for (const auto& r : results) {
            if (r.path == "open.txt") sawOpen = true;
        }
        ASSERT_TRUE(sawOpen);

        // glob helper
        ASSERT_TRUE(FileSearch::globMatch("*.txt", "a.txt", false));
        ASSERT_TRUE(!FileSearch::globMatch("*.txt", "d/a.txt", false));
        ASSERT_TRUE(FileSearch::globMatch("*.txt", "d/e/a.txt", true));
        ASSERT_TRUE(FileSearch::globMatch("e/*.txt", "d/e/a.txt", true));
        ASSERT_TRUE(!FileSearch::globMatch("*.txt", ".a.txt", true));
        ASSERT_TRUE(FileSearch::globMatch("file?.[ch]", "file1.c", false));

    } catch (const std::exception& e) {
        std::cerr << "Exception in test: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All FileSearch tests passed" << std::endl;
    return 0;
}
