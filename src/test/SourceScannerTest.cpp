#include <cassert>
#include <iostream>

#include "infrastructure/SourceDirectoryScanner.hpp"
#include "TestSupport.hpp"

using forker::infrastructure::SourceDirectoryScanner;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Source Scanner Test..." << std::endl;

    forker::test::ScratchDir dir("scanner");
    fs::path src = dir.sub("source");

    forker::test::WriteFile(src / "b.dcm", "bbb");
    forker::test::WriteFile(src / "a.dcm", "aa");
    forker::test::WriteFile(src / ".hidden", "h");
    forker::test::WriteFile(src / "upload.PART", "p");
    forker::test::WriteFile(src / "x.tmp", "t");
    fs::create_directories(src / "nested");
    fs::create_symlink(src / "a.dcm", src / "link.dcm");

    assert(SourceDirectoryScanner::IsIgnoredName(".hidden"));
    assert(SourceDirectoryScanner::IsIgnoredName("upload.PART"));
    assert(SourceDirectoryScanner::IsIgnoredName("job.primary.forker-tmp"));
    assert(!SourceDirectoryScanner::IsIgnoredName("scan.dcm"));

    SourceDirectoryScanner scanner(src.string(), std::chrono::milliseconds(0));

    // First sighting is never enough.
    assert(scanner.scan().empty());

    auto found = scanner.scan();
    assert(found.size() == 2);
    assert(fs::path(found[0].path).filename() == "a.dcm");
    assert(fs::path(found[1].path).filename() == "b.dcm");
    assert(found[0].sizeBytes == 2);
    assert(found[0].modifiedAtNs > 0);
    std::cout << "[PASS] Stable regular files reported in order; links, dot-files, partials and dirs ignored." << std::endl;

    // A file still growing is held back until two scans agree.
    forker::test::WriteFile(src / "b.dcm", "bbbbbb");
    found = scanner.scan();
    assert(found.size() == 1 && fs::path(found[0].path).filename() == "a.dcm");
    found = scanner.scan();
    assert(found.size() == 2 && found[1].sizeBytes == 6);
    std::cout << "[PASS] Changing file waits for a stable observation." << std::endl;

    // Minimum age
    SourceDirectoryScanner patient(src.string(), std::chrono::hours(1));
    patient.scan();
    assert(patient.scan().empty());
    std::cout << "[PASS] Files younger than the minimum age are not reported." << std::endl;

    // Missing directory is not an error.
    SourceDirectoryScanner missing((dir.path() / "absent").string(), std::chrono::milliseconds(0));
    assert(missing.scan().empty());

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
