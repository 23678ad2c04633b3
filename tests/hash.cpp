#include "bumv/hash.hpp"
#include "bumv/listfile.hpp"
#include "bumv/snapshot.hpp"

#include "scratch.hpp"

#include <iostream>

using testutil::expect;

int main() {
  try {
    expect(bumv::sha1_hex("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709", "sha1 of nothing");
    expect(bumv::sha1_hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d", "sha1 of abc");
    expect(bumv::to_hex(bumv::sha1("abc")).size() == 40, "hex length");

    // the snapshot fingerprint is the digest of the rendered list
    const bumv::Snapshot snap{"a", "b"};
    expect(bumv::snapshot_digest(snap) == bumv::sha1_hex("a\nb\n"), "snapshot digest");
    expect(bumv::snapshot_digest(snap) != bumv::snapshot_digest({"b", "a"}),
           "digest depends on order");

    std::cout << "hash test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
