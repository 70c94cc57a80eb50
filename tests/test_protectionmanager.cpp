/**
 * @file test_protectionmanager.cpp
 * @brief Unit tests for ProtectionManager and the protection backends
 *
 * Most tests run against FakeProtectionBackend so that failures can be
 * injected for single entries. The xattr tests are skipped on filesystems
 * without user extended attribute support.
 *
 * @see ProtectionManager
 * @see XattrProtectionBackend
 */

#include <gtest/gtest.h>
#include "fakeprotectionbackend.hpp"
#include "logger.hpp"
#include "protectionmanager.hpp"
#include "utils.hpp"
#include "xattrprotectionbackend.hpp"
#include <filesystem>
#include <fstream>
#include <sys/xattr.h>

namespace fs = std::filesystem;

class ProtectionManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<FakeProtectionBackend> backend;

    void SetUp() override {
        Logger::getInstance().setConsoleEnabled(false);

        test_dir = fs::temp_directory_path() / ("protection_test_" + randomHexString(8));
        fs::create_directories(test_dir);
        backend = std::make_shared<FakeProtectionBackend>();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    /**
     * @brief Builds a small tree
     *
     * root/
     *   a.txt
     *   sub/
     *     b.txt
     *     locked.txt
     *     deeper/
     *       c.txt
     */
    fs::path makeTree() {
        auto root = test_dir / "root";
        fs::create_directories(root / "sub" / "deeper");
        std::ofstream(root / "a.txt") << "a";
        std::ofstream(root / "sub" / "b.txt") << "b";
        std::ofstream(root / "sub" / "locked.txt") << "l";
        std::ofstream(root / "sub" / "deeper" / "c.txt") << "c";
        return root;
    }
};

/**
 * @test ProtectStoresClassAndBackupFlag
 * @brief A single protect() sets the class and excludes the entry from backups
 */
TEST_F(ProtectionManagerTest, ProtectStoresClassAndBackupFlag) {
    auto file = test_dir / "file";
    std::ofstream(file) << "x";
    ProtectionManager manager(backend);

    EXPECT_FALSE(manager.protect(file.string(), ProtectionClass::Complete));

    EXPECT_EQ(manager.protectionClassOf(file.string()), ProtectionClass::Complete);
    EXPECT_TRUE(backend->isExcludedFromBackup(file.string()));
}

TEST_F(ProtectionManagerTest, DefaultClassIsUntilFirstAuthentication) {
    auto file = test_dir / "file";
    std::ofstream(file) << "x";
    ProtectionManager manager(backend);

    EXPECT_FALSE(manager.protect(file.string()));
    EXPECT_EQ(manager.protectionClassOf(file.string()),
              ProtectionClass::CompleteUntilFirstUserAuthentication);
}

/**
 * @test ProtectIsIdempotent
 * @brief Re-applying the same class succeeds and keeps it
 */
TEST_F(ProtectionManagerTest, ProtectIsIdempotent) {
    auto dir = test_dir / "dir";
    fs::create_directories(dir);
    ProtectionManager manager(backend);

    EXPECT_FALSE(manager.protect(dir.string()));
    EXPECT_FALSE(manager.protect(dir.string()));
    EXPECT_EQ(manager.protectionClassOf(dir.string()), ProtectionManager::DEFAULT_CLASS);
}

TEST_F(ProtectionManagerTest, ProtectMissingPathFails) {
    ProtectionManager manager(backend);

    auto error = manager.protect((test_dir / "missing").string());

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, StorageErrc::PathNotFound);
    EXPECT_FALSE(fs::exists(test_dir / "missing"));
}

/**
 * @test NullBackendOnlyChecksExistence
 * @brief Without a backend protection succeeds but nothing is recorded
 */
TEST_F(ProtectionManagerTest, NullBackendOnlyChecksExistence) {
    auto file = test_dir / "file";
    std::ofstream(file) << "x";
    ProtectionManager manager(nullptr);

    EXPECT_EQ(manager.backend().name(), "none");
    EXPECT_FALSE(manager.protect(file.string()));
    EXPECT_FALSE(manager.protectionClassOf(file.string()).has_value());

    auto error = manager.protect((test_dir / "missing").string());
    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, StorageErrc::PathNotFound);
}

/**
 * @test ProtectRecursiveCoversWholeTree
 * @brief The root and every descendant receive the default class
 */
TEST_F(ProtectionManagerTest, ProtectRecursiveCoversWholeTree) {
    auto root = makeTree();
    ProtectionManager manager(backend);

    auto report = manager.protectRecursive(root.string());

    EXPECT_TRUE(report.fullySucceeded());
    EXPECT_EQ(report.attempted, 7u);
    EXPECT_EQ(backend->protectedCount(), 7u);
    EXPECT_EQ(manager.protectionClassOf((root / "sub" / "deeper" / "c.txt").string()),
              ProtectionManager::DEFAULT_CLASS);
}

/**
 * @test ProtectRecursiveContinuesAfterFailure
 * @brief One unprotectable entry does not stop the pass
 *
 * Expected behavior:
 * - The report is not fully successful and names the failing entry
 * - Every other entry is still protected
 */
TEST_F(ProtectionManagerTest, ProtectRecursiveContinuesAfterFailure) {
    auto root = makeTree();
    backend->failFor("locked.txt");
    ProtectionManager manager(backend);

    auto report = manager.protectRecursive(root.string());

    EXPECT_FALSE(report.fullySucceeded());
    EXPECT_EQ(report.attempted, 7u);
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, StorageErrc::PermissionDenied);
    EXPECT_EQ(report.failures[0].path, (root / "sub" / "locked.txt").string());

    EXPECT_EQ(backend->protectedCount(), 6u);
    EXPECT_TRUE(manager.protectionClassOf((root / "sub" / "deeper" / "c.txt").string()));
    EXPECT_FALSE(manager.protectionClassOf((root / "sub" / "locked.txt").string()));
}

TEST_F(ProtectionManagerTest, ProtectRecursiveOnMissingRoot) {
    ProtectionManager manager(backend);

    auto report = manager.protectRecursive((test_dir / "missing").string());

    EXPECT_FALSE(report.fullySucceeded());
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, StorageErrc::PathNotFound);
}

TEST_F(ProtectionManagerTest, ProtectRecursiveOnPlainFile) {
    auto file = test_dir / "single";
    std::ofstream(file) << "x";
    ProtectionManager manager(backend);

    auto report = manager.protectRecursive(file.string());

    EXPECT_TRUE(report.fullySucceeded());
    EXPECT_EQ(report.attempted, 1u);
}

/**
 * @test ProtectRecursiveSkipsSymlinks
 * @brief Links are neither followed nor protected
 */
TEST_F(ProtectionManagerTest, ProtectRecursiveSkipsSymlinks) {
    auto root = test_dir / "root";
    auto outside = test_dir / "outside";
    fs::create_directories(root);
    fs::create_directories(outside);
    std::ofstream(outside / "secret") << "s";
    fs::create_directory_symlink(outside, root / "link");

    ProtectionManager manager(backend);
    auto report = manager.protectRecursive(root.string());

    EXPECT_TRUE(report.fullySucceeded());
    EXPECT_EQ(report.attempted, 1u);
    EXPECT_FALSE(manager.protectionClassOf((outside / "secret").string()));
    EXPECT_FALSE(manager.protectionClassOf((root / "link").string()));
}

TEST_F(ProtectionManagerTest, ProtectionClassNames) {
    const ProtectionClass classes[] = {
        ProtectionClass::Complete, ProtectionClass::CompleteUnlessOpen,
        ProtectionClass::CompleteUntilFirstUserAuthentication, ProtectionClass::None};

    for (auto cls : classes) {
        EXPECT_EQ(protectionClassFromName(protectionClassName(cls)), cls);
    }
    EXPECT_EQ(protectionClassName(ProtectionClass::CompleteUnlessOpen),
              "complete-unless-open");
    EXPECT_FALSE(protectionClassFromName("bogus"));
}

TEST_F(ProtectionManagerTest, DetectBackendMatchesXattrSupport) {
    auto backend_in_use = ProtectionManager::detectBackend(test_dir);

    if (XattrProtectionBackend::isSupported(test_dir)) {
        EXPECT_EQ(backend_in_use->name(), "xattr");
    } else {
        EXPECT_EQ(backend_in_use->name(), "none");
    }
    EXPECT_FALSE(XattrProtectionBackend::isSupported(test_dir / "missing"));
}

/**
 * @test DefaultManagerProtectsOnAnyFilesystem
 * @brief The default manager always carries the xattr backend
 *
 * Protection succeeds whether or not the test directory supports user
 * xattrs; the class is only readable back where it does.
 */
TEST_F(ProtectionManagerTest, DefaultManagerProtectsOnAnyFilesystem) {
    ProtectionManager manager = ProtectionManager::createDefault();
    EXPECT_EQ(manager.backend().name(), "xattr");

    auto file = test_dir / "notes.db";
    std::ofstream(file) << "x";

    EXPECT_FALSE(manager.protect(file.string(), ProtectionClass::Complete));
    if (XattrProtectionBackend::isSupported(test_dir)) {
        EXPECT_EQ(manager.protectionClassOf(file.string()), ProtectionClass::Complete);
    }

    auto error = manager.protect((test_dir / "missing").string());
    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, StorageErrc::PathNotFound);
}

/**
 * @class XattrProtectionBackendTest
 * @brief Runs against the real extended attributes of the test directory
 *
 * Every test is skipped when user xattrs are unavailable (tmpfs without
 * user_xattr, some container overlays).
 */
class XattrProtectionBackendTest : public ProtectionManagerTest {
protected:
    void SetUp() override {
        ProtectionManagerTest::SetUp();
        if (!XattrProtectionBackend::isSupported(test_dir)) {
            GTEST_SKIP() << "user xattrs not supported in " << test_dir;
        }
    }
};

TEST_F(XattrProtectionBackendTest, StoresClassAsAttribute) {
    auto file = test_dir / "file";
    std::ofstream(file) << "x";
    ProtectionManager manager(std::make_shared<XattrProtectionBackend>());

    ASSERT_FALSE(manager.protect(file.string(), ProtectionClass::CompleteUnlessOpen));

    char buf[64];
    ssize_t len = getxattr(file.c_str(), XattrProtectionBackend::PROTECTION_XATTR,
                           buf, sizeof(buf));
    ASSERT_GT(len, 0);
    EXPECT_EQ(std::string(buf, static_cast<size_t>(len)), "complete-unless-open");
    EXPECT_GT(getxattr(file.c_str(), XattrProtectionBackend::BACKUP_XATTR, buf, sizeof(buf)), 0);

    EXPECT_EQ(manager.protectionClassOf(file.string()), ProtectionClass::CompleteUnlessOpen);
}

TEST_F(XattrProtectionBackendTest, ReprotectingChangesClass) {
    auto dir = test_dir / "dir";
    fs::create_directories(dir);
    ProtectionManager manager(std::make_shared<XattrProtectionBackend>());

    EXPECT_FALSE(manager.protect(dir.string()));
    EXPECT_FALSE(manager.protect(dir.string()));
    EXPECT_EQ(manager.protectionClassOf(dir.string()), ProtectionManager::DEFAULT_CLASS);

    EXPECT_FALSE(manager.protect(dir.string(), ProtectionClass::None));
    EXPECT_EQ(manager.protectionClassOf(dir.string()), ProtectionClass::None);
}

TEST_F(XattrProtectionBackendTest, BackupFlagCanBeCleared) {
    auto file = test_dir / "file";
    std::ofstream(file) << "x";
    XattrProtectionBackend xattr;

    EXPECT_FALSE(xattr.setExcludedFromBackup(file.string(), true));
    EXPECT_FALSE(xattr.setExcludedFromBackup(file.string(), false));
    EXPECT_FALSE(xattr.setExcludedFromBackup(file.string(), false));

    char buf[8];
    EXPECT_LT(getxattr(file.c_str(), XattrProtectionBackend::BACKUP_XATTR, buf, sizeof(buf)), 0);
}

TEST_F(XattrProtectionBackendTest, MissingPathIsReported) {
    XattrProtectionBackend xattr;

    auto error = xattr.setProtection((test_dir / "missing").string(), ProtectionClass::Complete);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, StorageErrc::PathNotFound);
}
