#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <chrono>
#include <filesystem>
#include <memory>
#include <regex>
#include <set>
#include <thread>
#include <vector>
#include <unistd.h>
#include "store/document_store.hpp"
#include "test_utils.hpp"

using namespace pdfshelf::store;

class DocumentStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDirectory> store_dir;
  std::unique_ptr<TempDirectory> render_dir;
  std::unique_ptr<DocumentStore> store;

  void SetUp() override {
    quiet_logging();
    store_dir = std::make_unique<TempDirectory>("document_store_test");
    render_dir = std::make_unique<TempDirectory>("document_store_render");
    store = std::make_unique<DocumentStore>(store_dir->path());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    render_dir.reset();
    store_dir.reset();
  }

  // Helper methods to reduce repetition
  std::filesystem::path render(const std::string& content, const std::string& file = "") {
    static int counter = 0;
    const auto path = render_dir->path() /
      (file.empty() ? "render_" + std::to_string(++counter) + ".pdf" : file);
    write_file(path, content);
    return path;
  }

  StoredDocument commit_and_verify(const std::string& display_name, const std::string& content) {
    const auto source = render(content);
    StoredDocument document;
    EXPECT_NO_THROW(document = store->commit(source, display_name)) << "Failed to commit: " << display_name;
    EXPECT_TRUE(std::filesystem::exists(store_dir->path() / document.name));
    EXPECT_EQ(read_file(store_dir->path() / document.name), content);
    EXPECT_FALSE(std::filesystem::exists(source)) << "Source should be removed after commit";
    return document;
  }

  void place(const std::string& name, const std::string& content,
    std::filesystem::file_time_type modified) {
    write_file(store_dir->path() / name, content);
    std::filesystem::last_write_time(store_dir->path() / name, modified);
  }

  static std::vector<std::string> names_of(const std::vector<StoredDocument>& documents) {
    std::vector<std::string> names;
    for (const auto& document : documents) {
      names.push_back(document.name);
    }
    return names;
  }
};

TEST_F(DocumentStoreTest, CommitRelocatesSource) {
  const auto document = commit_and_verify("Invoice", "%PDF-1.4 invoice");

  EXPECT_EQ(document.name, "Invoice.pdf");
  EXPECT_EQ(document.path, store_dir->path() / "Invoice.pdf");
  EXPECT_EQ(document.size_bytes, std::string("%PDF-1.4 invoice").size());
}

TEST_F(DocumentStoreTest, CommitSanitizesDisplayName) {
  const auto document = commit_and_verify("My/Report:2024", "report");
  EXPECT_EQ(document.name, "My_Report_2024.pdf");
  EXPECT_TRUE(std::filesystem::exists(store_dir->path() / "My_Report_2024.pdf"));
}

TEST_F(DocumentStoreTest, CommitSynthesizesNameFromImageCount) {
  const auto document = store->commit(render("scan"), "   ", 4);
  EXPECT_TRUE(std::regex_match(document.name,
    std::regex("Document-\\d{4}-\\d{2}-\\d{2}-\\d{6}-4images\\.pdf"))) << document.name;
}

TEST_F(DocumentStoreTest, SameNameTwiceGivesTwoDocuments) {
  const auto first = commit_and_verify("Invoice", "first");
  const auto second = commit_and_verify("Invoice", "second");

  EXPECT_EQ(first.name, "Invoice.pdf");
  EXPECT_NE(first.name, second.name);
  EXPECT_TRUE(std::regex_match(second.name, std::regex("Invoice_[0-9]+\\.pdf"))) << second.name;

  const auto names = names_of(store->list());
  EXPECT_EQ(names.size(), 2u);
  EXPECT_NE(std::find(names.begin(), names.end(), first.name), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), second.name), names.end());
}

TEST_F(DocumentStoreTest, CommitNeverOverwritesExistingDocument) {
  write_file(store_dir->path() / "Invoice.pdf", "original");

  const auto document = commit_and_verify("Invoice.pdf", "replacement");
  EXPECT_NE(document.name, "Invoice.pdf");
  EXPECT_EQ(read_file(store_dir->path() / "Invoice.pdf"), "original");
}

TEST_F(DocumentStoreTest, MissingSourceFails) {
  const auto missing = render_dir->path() / "never_rendered.pdf";

  try {
    store->commit(missing, "Invoice");
    FAIL() << "Expected SourceNotFoundError";
  } catch (const SourceNotFoundError& e) {
    EXPECT_EQ(e.code(), StoreErrorCode::SOURCE_NOT_FOUND);
  }

  EXPECT_TRUE(store->list().empty());
  EXPECT_TRUE(std::filesystem::is_empty(store_dir->path()));
}

TEST_F(DocumentStoreTest, DirectorySourceIsNotAFile) {
  std::filesystem::create_directories(render_dir->path() / "folder");
  EXPECT_THROW(store->commit(render_dir->path() / "folder", "Invoice"), SourceNotFoundError);
  EXPECT_TRUE(store->list().empty());
}

TEST_F(DocumentStoreTest, UnwritableDestinationKeepsSource) {
  const auto source = render("content");

  // Swap the managed directory for a plain file so the copy cannot succeed
  std::filesystem::remove_all(store_dir->path());
  write_file(store_dir->path(), "not a directory");

  EXPECT_THROW(store->commit(source, "Invoice"), DestinationUnwritableError);
  EXPECT_TRUE(std::filesystem::exists(source));
}

TEST_F(DocumentStoreTest, ListReturnsNewestFirst) {
  const auto now = std::filesystem::file_time_type::clock::now();
  place("t1.pdf", "1", now - std::chrono::hours(3));
  place("t3.pdf", "333", now - std::chrono::hours(1));
  place("t2.pdf", "22", now - std::chrono::hours(2));

  const auto documents = store->list();
  ASSERT_EQ(documents.size(), 3u);
  EXPECT_EQ(names_of(documents), (std::vector<std::string>{"t3.pdf", "t2.pdf", "t1.pdf"}));
  EXPECT_EQ(documents[0].size_bytes, 3u);
  EXPECT_EQ(documents[2].size_bytes, 1u);
}

TEST_F(DocumentStoreTest, ListBreaksTiesByName) {
  const auto when = std::filesystem::file_time_type::clock::now() - std::chrono::minutes(5);
  place("charlie.pdf", "c", when);
  place("alpha.pdf", "a", when);
  place("bravo.pdf", "b", when);

  EXPECT_EQ(names_of(store->list()),
    (std::vector<std::string>{"alpha.pdf", "bravo.pdf", "charlie.pdf"}));
}

TEST_F(DocumentStoreTest, ListOnlyIncludesPdfFiles) {
  const auto when = std::filesystem::file_time_type::clock::now();
  place("report.pdf", "r", when);
  place("SCAN.PDF", "s", when - std::chrono::seconds(1));
  place("notes.txt", "n", when);
  place("pdf", "p", when);
  std::filesystem::create_directories(store_dir->path() / "folder.pdf");

  EXPECT_EQ(names_of(store->list()), (std::vector<std::string>{"report.pdf", "SCAN.PDF"}));
}

TEST_F(DocumentStoreTest, ListOfVanishedDirectoryIsEmpty) {
  std::filesystem::remove_all(store_dir->path());
  EXPECT_TRUE(store->list().empty());
}

TEST_F(DocumentStoreTest, InfoReadsFreshMetadata) {
  const auto document = commit_and_verify("Growing", "abc");
  EXPECT_EQ(store->info(document).size_bytes, 3u);

  write_file(store_dir->path() / document.name, "abcdefgh");
  EXPECT_EQ(store->info(document).size_bytes, 8u);
  EXPECT_EQ(document.size_bytes, 3u);
}

TEST_F(DocumentStoreTest, InfoOnVanishedDocumentFails) {
  const auto document = commit_and_verify("Gone", "data");
  std::filesystem::remove(store_dir->path() / document.name);

  try {
    store->info(document);
    FAIL() << "Expected DocumentNotFoundError";
  } catch (const DocumentNotFoundError& e) {
    EXPECT_EQ(e.code(), StoreErrorCode::NOT_FOUND);
  }
}

TEST_F(DocumentStoreTest, RemoveIsIdempotent) {
  const auto document = commit_and_verify("Invoice", "data");

  EXPECT_TRUE(store->remove(document));
  EXPECT_FALSE(std::filesystem::exists(store_dir->path() / document.name));
  EXPECT_FALSE(store->remove(document));
  EXPECT_TRUE(store->list().empty());
}

TEST_F(DocumentStoreTest, RemoveNeverCreatedReturnsFalse) {
  bool removed = true;
  EXPECT_NO_THROW(removed = store->remove("never_created.pdf"));
  EXPECT_FALSE(removed);
}

TEST_F(DocumentStoreTest, RemoveStaysInsideManagedDirectory) {
  const auto outside = render("outside", "outside.pdf");
  const auto relative = std::filesystem::relative(outside, store_dir->path()).string();

  EXPECT_FALSE(store->remove(relative));
  EXPECT_FALSE(store->remove(outside.string()));
  EXPECT_FALSE(store->remove(".."));
  EXPECT_TRUE(std::filesystem::exists(outside));
}

TEST_F(DocumentStoreTest, FindLocatesCommittedDocument) {
  const auto document = commit_and_verify("Lookup", "data");

  const auto found = store->find("Lookup.pdf");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->name, document.name);
  EXPECT_EQ(found->size_bytes, document.size_bytes);
  EXPECT_EQ(found->id(), document.id());
  EXPECT_EQ(found->id().rfind("Lookup.pdf_", 0), 0u);

  EXPECT_FALSE(store->find("missing.pdf").has_value());
  EXPECT_FALSE(store->find("").has_value());
}

TEST_F(DocumentStoreTest, ConstructorCreatesNestedDirectory) {
  const auto nested = store_dir->path() / "a" / "b" / "documents";
  DocumentStore nested_store(nested);
  EXPECT_TRUE(std::filesystem::is_directory(nested));
  EXPECT_EQ(nested_store.directory(), nested);
}

TEST_F(DocumentStoreTest, ConstructorRejectsFilePath) {
  const auto file = render("plain file", "occupied");
  EXPECT_THROW(DocumentStore{file}, DestinationUnwritableError);
}

TEST_F(DocumentStoreTest, ConcurrentCommits) {
  const size_t num_threads = 4;
  const size_t ops_per_thread = 10;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        const std::string name = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
        const auto source = render_dir->path() / (name + ".tmp");
        write_file(source, "Data for " + name);
        try {
          store->commit(source, name);
          successful_ops++;
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  const auto names = names_of(store->list());
  EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), num_threads * ops_per_thread);
}

TEST_F(DocumentStoreTest, LongNameCommittedTwiceStaysWithinLimit) {
  const std::string long_name(150, 'a');

  const auto first = commit_and_verify(long_name, "first");
  const auto second = commit_and_verify(long_name, "second");

  EXPECT_EQ(first.name.size(), kMaxDocumentNameLength);
  EXPECT_LE(second.name.size(), kMaxDocumentNameLength);
  EXPECT_NE(first.name, second.name);
  EXPECT_EQ(store->list().size(), 2u);
}

TEST_F(DocumentStoreTest, SourceCleanupFailureDoesNotFailCommit) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root ignores directory permissions";
  }

  const auto locked = render_dir->path() / "locked";
  std::filesystem::create_directories(locked);
  const auto source = locked / "render.pdf";
  write_file(source, "kept source");
  std::filesystem::permissions(locked,
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec);

  StoredDocument document;
  EXPECT_NO_THROW(document = store->commit(source, "Locked"));

  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

  EXPECT_EQ(document.name, "Locked.pdf");
  EXPECT_TRUE(std::filesystem::exists(source));
  EXPECT_EQ(read_file(store_dir->path() / "Locked.pdf"), "kept source");
  EXPECT_EQ(names_of(store->list()), (std::vector<std::string>{"Locked.pdf"}));
}

// A dangling symlink is invisible to the existence probe but still blocks an
// exclusive create, the same as a file written between resolution and copy
TEST_F(DocumentStoreTest, LostCopyRaceResolvesAgain) {
  write_file(store_dir->path() / "Invoice.pdf", "original");
  std::filesystem::create_symlink(render_dir->path() / "nowhere", store_dir->path() / "Invoice_1.pdf");

  int ticks = 0;
  DocumentStore racing_store(store_dir->path(),
    CollisionResolver([&ticks]() { return std::int64_t{++ticks}; }));

  const auto source = render("replacement");
  const auto document = racing_store.commit(source, "Invoice");

  EXPECT_EQ(ticks, 2);
  EXPECT_EQ(document.name, "Invoice_2.pdf");
  EXPECT_EQ(read_file(store_dir->path() / "Invoice_2.pdf"), "replacement");
  EXPECT_EQ(read_file(store_dir->path() / "Invoice.pdf"), "original");
  EXPECT_TRUE(std::filesystem::is_symlink(store_dir->path() / "Invoice_1.pdf"));
  EXPECT_FALSE(std::filesystem::exists(source));
}

TEST_F(DocumentStoreTest, SecondLostCopyRaceFails) {
  std::filesystem::create_symlink(render_dir->path() / "nowhere", store_dir->path() / "Invoice.pdf");

  const auto source = render("content");
  try {
    store->commit(source, "Invoice");
    FAIL() << "Expected CollisionUnresolvedError";
  } catch (const CollisionUnresolvedError& e) {
    EXPECT_EQ(e.code(), StoreErrorCode::COLLISION_UNRESOLVED);
  }

  EXPECT_TRUE(std::filesystem::exists(source));
  EXPECT_TRUE(std::filesystem::is_symlink(store_dir->path() / "Invoice.pdf"));
  EXPECT_TRUE(store->list().empty());
}

TEST_F(DocumentStoreTest, ConcurrentCommitsOfSameNameNeverOverwrite) {
  const size_t num_threads = 8;
  std::atomic<size_t> committed{0};
  std::atomic<size_t> unresolved{0};
  std::vector<std::filesystem::path> sources;
  for (size_t i = 0; i < num_threads; ++i) {
    sources.push_back(render("payload " + std::to_string(i)));
  }

  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &sources, &committed, &unresolved]() {
      try {
        store->commit(sources[i], "Shared");
        committed++;
      } catch (const CollisionUnresolvedError&) {
        unresolved++;
      } catch (const std::exception& e) {
        ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_GE(committed.load(), 1u);
  EXPECT_EQ(committed + unresolved, num_threads);

  const auto documents = store->list();
  EXPECT_EQ(documents.size(), committed.load());
  std::set<std::string> payloads;
  for (const auto& document : documents) {
    EXPECT_LE(document.name.size(), kMaxDocumentNameLength);
    payloads.insert(read_file(document.path));
  }
  // Every stored file holds a different payload, so none was written twice
  EXPECT_EQ(payloads.size(), documents.size());
}

TEST_F(DocumentStoreTest, IdCarriesEpochMillis) {
  const auto document = commit_and_verify("Stamped", "data");

  const std::string id = document.id();
  ASSERT_EQ(id.rfind("Stamped.pdf_", 0), 0u);
  const std::int64_t millis = std::stoll(id.substr(std::string("Stamped.pdf_").size()));
  const std::int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();

  EXPECT_GT(millis, 0);
  EXPECT_LT(std::llabs(now - millis), 60 * 1000);
  EXPECT_EQ(store->find("Stamped.pdf")->id(), id);
}

TEST_F(DocumentStoreTest, NonPdfEntriesAreNotManaged) {
  write_file(store_dir->path() / "notes.txt", "notes");

  EXPECT_FALSE(store->find("notes.txt").has_value());
  EXPECT_THROW(store->info("notes.txt"), DocumentNotFoundError);
  EXPECT_FALSE(store->remove("notes.txt"));
  EXPECT_TRUE(std::filesystem::exists(store_dir->path() / "notes.txt"));
}
