// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Candidate ranking and selection

#include <catch2/catch_test_macros.hpp>

#include "network/node_discovery.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace chainsync::network;

namespace {

CandidateNode Node(const std::string& id, std::optional<uint64_t> td) {
  CandidateNode node;
  node.id = id;
  if (td) {
    node.stats.last_status_total_difficulty = arith_uint256(*td);
  }
  return node;
}

std::vector<NodeId> Ids(const std::vector<CandidateNode>& nodes) {
  std::vector<NodeId> ids;
  for (const auto& n : nodes) {
    ids.push_back(n.id);
  }
  return ids;
}

}  // namespace

TEST_CASE("CompareByTotalDifficultyDesc: total order", "[network][discovery]") {
  const auto high = Node("high", 50);
  const auto low = Node("low", 20);
  const auto unknown1 = Node("u1", std::nullopt);
  const auto unknown2 = Node("u2", std::nullopt);

  CHECK(CompareByTotalDifficultyDesc(high, low));
  CHECK_FALSE(CompareByTotalDifficultyDesc(low, high));

  CHECK(CompareByTotalDifficultyDesc(low, unknown1));
  CHECK_FALSE(CompareByTotalDifficultyDesc(unknown1, low));

  CHECK_FALSE(CompareByTotalDifficultyDesc(unknown1, unknown2));
  CHECK_FALSE(CompareByTotalDifficultyDesc(unknown2, unknown1));

  CHECK_FALSE(CompareByTotalDifficultyDesc(high, Node("same", 50)));
}

TEST_CASE("SelectCandidates: filter, rank, limit", "[network][discovery]") {
  const std::vector<CandidateNode> nodes = {
      Node("u1", std::nullopt), Node("n30", 30), Node("n50", 50), Node("u2", std::nullopt),
      Node("n20", 20),          Node("n40", 40), Node("u3", std::nullopt),
  };

  SECTION("unknown difficulty sorts last and keeps input order") {
    const auto all = SelectCandidates(nodes, nullptr, CompareByTotalDifficultyDesc, 100);
    CHECK(Ids(all) == std::vector<NodeId>{"n50", "n40", "n30", "n20", "u1", "u2", "u3"});
  }

  SECTION("limit truncates after ranking") {
    const auto top = SelectCandidates(nodes, nullptr, CompareByTotalDifficultyDesc, 2);
    CHECK(Ids(top) == std::vector<NodeId>{"n50", "n40"});
  }

  SECTION("filter applies before ranking") {
    const CandidateFilter has_status = [](const CandidateNode& n) { return n.stats.HasStatus(); };
    const auto filtered = SelectCandidates(nodes, has_status, CompareByTotalDifficultyDesc, 10);
    CHECK(Ids(filtered) == std::vector<NodeId>{"n50", "n40", "n30", "n20"});
  }

  SECTION("zero limit") {
    CHECK(SelectCandidates(nodes, nullptr, CompareByTotalDifficultyDesc, 0).empty());
  }
}

TEST_CASE("ShortNodeId", "[network]") {
  CHECK(ShortNodeId("0123456789abcdef") == "01234567");
  CHECK(ShortNodeId("abc") == "abc");
}
