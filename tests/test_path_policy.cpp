#include <iostream>
#include <fstream>
#include <filesystem>
#include "../src/PathPolicy.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    auto root = std::filesystem::temp_directory_path() / "genome_path_policy";
    try {
        std::filesystem::create_directories(root / "data");
        std::filesystem::create_directories(root / "data-other");
        { std::ofstream(root / "data" / "sample.vcf") << "x\n"; }
        { std::ofstream(root / "data-other" / "sample.vcf") << "x\n"; }

        PathPolicy policy;
        // 1) No list: everything allowed
        ASSERT_TRUE(policy.isPathAllowed((root / "data-other" / "sample.vcf").string()));

        // 2) Nested files allowed, sibling with a shared prefix denied
        policy.setAllowedPaths({(root / "data").string()});
        ASSERT_TRUE(policy.allowedPaths().size() == 1);
        ASSERT_TRUE(policy.isPathAllowed((root / "data" / "sample.vcf").string()));
        ASSERT_TRUE(policy.isPathAllowed((root / "data").string()));
        ASSERT_TRUE(!policy.isPathAllowed((root / "data-other" / "sample.vcf").string()));

        // 3) Traversal is resolved before matching
        ASSERT_TRUE(!policy.isPathAllowed((root / "data" / ".." / "data-other" / "sample.vcf").string()));

        // 4) Nonexistent targets are denied under a restriction
        ASSERT_TRUE(!policy.isPathAllowed((root / "data" / "missing.vcf").string()));

        // 5) Entries that do not resolve are skipped and deny everything
        policy.setAllowedPaths({(root / "nope").string()});
        ASSERT_TRUE(policy.allowedPaths().empty());
        ASSERT_TRUE(!policy.isPathAllowed((root / "data" / "sample.vcf").string()));

        // 6) Root allows all
        policy.setAllowedPaths({"/"});
        ASSERT_TRUE(policy.isPathAllowed((root / "data-other" / "sample.vcf").string()));

        // 7) Clearing lifts the restriction
        policy.setAllowedPaths({});
        ASSERT_TRUE(policy.isPathAllowed((root / "data-other" / "sample.vcf").string()));
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::filesystem::remove_all(root);
    std::cout << "All path policy tests passed" << std::endl;
    return 0;
}
