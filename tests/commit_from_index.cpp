#include "gitstamp/consts.hpp"
#include "gitstamp/hash.hpp"
#include "gitstamp/index.hpp"
#include "gitstamp/refs.hpp"
#include "gitstamp/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitstamp_cmt_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    gitstamp::Repository repo{root};
    repo.init(gitstamp::Identity{.name = "User", .email = "u@example.com"});

    write_file(root / "a.txt", "hello\n");
    write_file(root / "src" / "lib" / "b.txt", "nested\n");
    gitstamp::Index idx{repo.index_file()};
    idx.load();
    idx.add_path(root, "a.txt", repo);
    idx.add_path(root, "src/lib/b.txt", repo);
    idx.save();

    const std::string c1 = repo.commit_index("first\n");

    // The current branch should point at c1
    const auto head = gitstamp::resolve_head(repo);
    if (!head.branch || *head.branch != "refs/heads/master") {
      std::cerr << "HEAD not symbolic on master\n";
      return 1;
    }
    auto ref = gitstamp::read_ref(repo, *head.branch);
    if (!ref || *ref != c1 || repo.head_commit() != c1) {
      std::cerr << "ref not updated\n";
      return 1;
    }

    // Tree round trip: root holds a.txt and src/
    const auto info = repo.read_commit(c1);
    const auto tree = repo.read_tree(info.tree_hex);
    if (tree.size() != 2 || tree[0].name != "a.txt" || tree[1].name != "src" ||
        tree[1].mode != gitstamp::consts::kModeTree) {
      std::cerr << "unexpected root tree layout\n";
      return 1;
    }
    if (!info.parents.empty() || info.author.find("User <u@example.com>") != 0) {
      std::cerr << "unexpected first commit headers\n";
      return 1;
    }

    // Known blob id for "hello\n" (git hash-object)
    if (gitstamp::to_hex(tree[0].id) != "ce013625030ba8dba906f756967f9e9ca394464a") {
      std::cerr << "blob id mismatch: " << gitstamp::to_hex(tree[0].id) << "\n";
      return 1;
    }
    const auto blob = repo.objects().read(gitstamp::to_hex(tree[0].id));
    if (blob.type != gitstamp::consts::kTypeBlob ||
        std::string(blob.data.begin(), blob.data.end()) != "hello\n") {
      std::cerr << "blob contents mismatch\n";
      return 1;
    }

    // Second commit has parent=c1
    write_file(root / "c.txt", "C\n");
    idx.load();
    idx.add_path(root, "c.txt", repo);
    idx.save();
    const std::string c2 = repo.commit_index("second\n");

    auto ref2 = gitstamp::read_ref(repo, *head.branch);
    if (!ref2 || *ref2 != c2) {
      std::cerr << "ref not updated to c2\n";
      return 1;
    }
    const auto info2 = repo.read_commit(c2);
    if (info2.parents.size() != 1 || info2.parents[0] != c1 || info2.message != "second\n") {
      std::cerr << "second commit does not chain to the first\n";
      return 1;
    }

    // Detached HEAD: the next commit moves HEAD itself
    gitstamp::set_HEAD_detached(repo, c1);
    const std::string c3 = repo.commit_index("detached\n");
    const auto head3 = gitstamp::resolve_head(repo);
    if (head3.branch || !head3.commit || *head3.commit != c3 ||
        gitstamp::read_ref(repo, "refs/heads/master") != c2) {
      std::cerr << "detached commit moved the branch or not HEAD\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
