#include "manifest/errors.h"
#include "manifest/memory_manifest.h"
#include "manifest_fixtures.h"
#include "mocks/mock_content_store.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <gtest/gtest.h>

using namespace mosaic;
using namespace mosaic::test;
using ::testing::_;
using ::testing::AnyNumber;

class MemoryManifestTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        store_ = std::make_shared<::testing::NiceMock<MockContentStore>>();
        ctx_.store = store_;
        ctx_.logger = &Logger::getInstance();
        ctx_.metrics = &metrics_;
        ctx_.parallel = GetParam();
    }

    ContentStore& seed() { return store_->fake(); }

    std::shared_ptr<::testing::NiceMock<MockContentStore>> store_;
    MetricsRegistry metrics_;
    ManifestContext ctx_;
};

TEST_P(MemoryManifestTest, EmptyTreeIsModifiedAndEmpty) {
    MemoryManifestEntry tree = MemoryManifestEntry::emptyTree();
    EXPECT_TRUE(tree.isDir());
    EXPECT_TRUE(tree.isModified());
    EXPECT_TRUE(tree.isEmpty(ctx_).get());
}

TEST_P(MemoryManifestTest, ConvertedTreeIsClean) {
    NodeHash base = putTree(seed(), {entry(leaf(seed(), "f", "data"))});
    MemoryManifestEntry tree = MemoryManifestEntry::convertTreenode(base);
    ASSERT_TRUE(tree.tree());
    EXPECT_FALSE(tree.isModified());
    EXPECT_EQ(tree.tree()->base, base);
    EXPECT_EQ(tree.tree()->p1, base);
    EXPECT_FALSE(tree.tree()->p2);
    EXPECT_FALSE(tree.isEmpty(ctx_).get());
}

TEST_P(MemoryManifestTest, LeavesAndConflictsAreNeverEmpty) {
    MemoryManifestEntry a(leaf(seed(), "a", "one"));
    MemoryManifestEntry b(leaf(seed(), "a", "two"));
    MemoryManifestEntry conflict(ConflictSet{{a, b}});
    EXPECT_FALSE(a.isModified());
    EXPECT_FALSE(a.isEmpty(ctx_).get());
    EXPECT_FALSE(conflict.isEmpty(ctx_).get());
}

TEST_P(MemoryManifestTest, GetNewChildrenAppliesChangesOverBaseline) {
    BlobEntry keep = leaf(seed(), "keep", "k");
    BlobEntry gone = leaf(seed(), "gone", "g");
    BlobEntry replaced = leaf(seed(), "replaced", "old");
    NodeHash sub = putTree(seed(), {entry(leaf(seed(), "inner", "i"))});
    NodeHash base = putTree(seed(), {entry(keep), entry(gone), entry(replaced),
                                     treeEntry("sub", sub)});

    MemoryManifestEntry tree = MemoryManifestEntry::convertTreenode(base);
    BlobEntry newer = leaf(seed(), "replaced", "new");
    BlobEntry added = leaf(seed(), "added", "a");
    tree.change(MPathElement("gone"), std::nullopt);
    tree.change(MPathElement("replaced"), newer);
    tree.change(MPathElement("added"), added);
    EXPECT_TRUE(tree.isModified());

    ChildMap children = tree.getNewChildren(ctx_).get();
    ASSERT_EQ(children.size(), 4u);
    EXPECT_EQ(children.count(MPathElement("gone")), 0u);
    EXPECT_EQ(*children.at(MPathElement("keep")).blob(), keep);
    EXPECT_EQ(*children.at(MPathElement("replaced")).blob(), newer);
    EXPECT_EQ(*children.at(MPathElement("added")).blob(), added);

    const MemoryManifestEntry& subEntry = children.at(MPathElement("sub"));
    ASSERT_TRUE(subEntry.isDir());
    EXPECT_EQ(subEntry.tree()->base, sub);
    EXPECT_EQ(subEntry.tree()->p1, sub);
}

TEST_P(MemoryManifestTest, GetNewChildrenWithoutBaselineUsesChangesOnly) {
    MemoryManifestEntry tree = MemoryManifestEntry::emptyTree();
    tree.change(MPathElement("x"), leaf(seed(), "x", "1"));
    tree.change(MPathElement("y"), std::nullopt);
    ChildMap children = tree.getNewChildren(ctx_).get();
    ASSERT_EQ(children.size(), 1u);
    EXPECT_TRUE(children.count(MPathElement("x")));
}

TEST_P(MemoryManifestTest, MissingBaselineRaisesManifestMissing) {
    MemoryContentStore other;
    NodeHash absent = other.put(bytes("never seen by this store"));
    MemoryManifestEntry tree = MemoryManifestEntry::convertTreenode(absent);
    try {
        tree.getNewChildren(ctx_).get();
        FAIL() << "expected ManifestMissing";
    } catch (const ManifestMissing& e) {
        EXPECT_EQ(e.hash(), absent);
        EXPECT_EQ(e.kind(), ManifestErrorKind::ManifestMissing);
    }
}

TEST_P(MemoryManifestTest, ChangeOnLeafThrowsNotADirectory) {
    MemoryManifestEntry file(leaf(seed(), "f", "x"));
    EXPECT_THROW(file.change(MPathElement("child"), std::nullopt), NotADirectory);
}

TEST_P(MemoryManifestTest, CopiesShareTheirChangeSet) {
    MemoryManifestEntry tree = MemoryManifestEntry::emptyTree();
    MemoryManifestEntry alias = tree;
    alias.change(MPathElement("f"), leaf(seed(), "f", "x"));
    EXPECT_EQ(tree.changesSnapshot().size(), 1u);
}

TEST_P(MemoryManifestTest, LeafConflictKeepsMergeOrder) {
    MemoryManifestEntry a(leaf(seed(), "f", "mine"));
    MemoryManifestEntry b(leaf(seed(), "f", "theirs"));

    MemoryManifestEntry ab = a.mergeWithConflicts(b, ctx_, RepoPath::root()).get();
    ASSERT_TRUE(ab.isConflict());
    ASSERT_EQ(ab.conflict()->candidates.size(), 2u);
    EXPECT_EQ(*ab.conflict()->candidates[0].blob(), *a.blob());
    EXPECT_EQ(*ab.conflict()->candidates[1].blob(), *b.blob());

    MemoryManifestEntry ba = b.mergeWithConflicts(a, ctx_, RepoPath::root()).get();
    ASSERT_TRUE(ba.isConflict());
    EXPECT_EQ(*ba.conflict()->candidates[0].blob(), *b.blob());
    EXPECT_EQ(*ba.conflict()->candidates[1].blob(), *a.blob());

    EXPECT_EQ(metrics_.counterValue("mosaic_merge_conflicts_total"), 2);
}

TEST_P(MemoryManifestTest, EqualLeavesMergeToThemselves) {
    BlobEntry f = leaf(seed(), "f", "same");
    MemoryManifestEntry merged =
        MemoryManifestEntry(f).mergeWithConflicts(MemoryManifestEntry(f), ctx_,
                                                  RepoPath::root())
            .get();
    ASSERT_TRUE(merged.isBlob());
    EXPECT_EQ(*merged.blob(), f);
}

TEST_P(MemoryManifestTest, LeafAgainstTreeIsAConflict) {
    NodeHash sub = putTree(seed(), {entry(leaf(seed(), "x", "1"))});
    MemoryManifestEntry file(leaf(seed(), "d", "file"));
    MemoryManifestEntry dir = MemoryManifestEntry::convertTreenode(sub);

    MemoryManifestEntry merged = dir.mergeWithConflicts(file, ctx_, RepoPath::root()).get();
    ASSERT_TRUE(merged.isConflict());
    EXPECT_TRUE(merged.conflict()->candidates[0].isDir());
    EXPECT_TRUE(merged.conflict()->candidates[1].isBlob());
}

TEST_P(MemoryManifestTest, MergeWithItselfIsIdentity) {
    NodeHash base = putTree(seed(), {entry(leaf(seed(), "f", "x"))});
    EXPECT_CALL(*store_, put(_)).Times(0);

    MemoryManifestEntry a = MemoryManifestEntry::convertTreenode(base);
    MemoryManifestEntry b = MemoryManifestEntry::convertTreenode(base);
    MemoryManifestEntry merged = a.mergeWithConflicts(b, ctx_, RepoPath::root()).get();
    ASSERT_TRUE(merged.isDir());
    EXPECT_FALSE(merged.isModified());
    EXPECT_EQ(merged.tree()->base, base);

    BlobEntry saved = merged.save(ctx_, RepoPath::root()).get();
    EXPECT_EQ(saved.hash(), base);
    EXPECT_FALSE(saved.name());
}

TEST_P(MemoryManifestTest, MergeRejectsConflicts) {
    MemoryManifestEntry a(leaf(seed(), "f", "1"));
    MemoryManifestEntry b(leaf(seed(), "f", "2"));
    MemoryManifestEntry conflict(ConflictSet{{a, b}});
    EXPECT_THROW(conflict.mergeWithConflicts(a, ctx_, RepoPath::root()).get(),
                 UnresolvedConflicts);
    EXPECT_THROW(a.mergeWithConflicts(conflict, ctx_, RepoPath::root()).get(),
                 UnresolvedConflicts);
}

TEST_P(MemoryManifestTest, MergeRejectsTwoParentTree) {
    NodeHash p1 = putTree(seed(), {entry(leaf(seed(), "a", "1"))});
    NodeHash p2 = putTree(seed(), {entry(leaf(seed(), "b", "2"))});
    NodeHash other = putTree(seed(), {entry(leaf(seed(), "c", "3"))});

    MemoryManifestEntry merged = MemoryManifestEntry::memTree(p1, p1, p2);
    ASSERT_FALSE(merged.isModified());
    try {
        merged.mergeWithConflicts(MemoryManifestEntry::convertTreenode(other), ctx_,
                                  RepoPath::root())
            .get();
        FAIL() << "expected ManifestAlreadyAMerge";
    } catch (const ManifestAlreadyAMerge& e) {
        EXPECT_EQ(e.p1(), p1);
        EXPECT_EQ(e.p2(), p2);
    }
    EXPECT_THROW(MemoryManifestEntry::convertTreenode(other)
                     .mergeWithConflicts(merged, ctx_, RepoPath::root())
                     .get(),
                 ManifestAlreadyAMerge);
}

TEST_P(MemoryManifestTest, TreeMergeRecordsBothParents) {
    BlobEntry shared = leaf(seed(), "shared", "s");
    NodeHash left = putTree(seed(), {entry(shared), entry(leaf(seed(), "a", "a"))});
    NodeHash right = putTree(seed(), {entry(shared), entry(leaf(seed(), "b", "b"))});

    MemoryManifestEntry merged = MemoryManifestEntry::convertTreenode(left)
                                     .mergeWithConflicts(
                                         MemoryManifestEntry::convertTreenode(right), ctx_,
                                         RepoPath::root())
                                     .get();
    ASSERT_TRUE(merged.isDir());
    EXPECT_FALSE(merged.tree()->base);
    EXPECT_EQ(merged.tree()->p1, left);
    EXPECT_EQ(merged.tree()->p2, right);

    ChangeMap changes = merged.changesSnapshot();
    ASSERT_EQ(changes.size(), 3u);
    for (const auto& [name, change] : changes) {
        ASSERT_TRUE(change) << name.str();
        EXPECT_TRUE(change->isBlob()) << name.str();
    }
}

TEST_P(MemoryManifestTest, ModifiedSideIsSavedBeforeMerging) {
    NodeHash right = putTree(seed(), {entry(leaf(seed(), "b", "b"))});
    MemoryManifestEntry left = MemoryManifestEntry::emptyTree();
    BlobEntry a = leaf(seed(), "a", "a");
    left.change(a.name().value(), a);

    MemoryManifestEntry merged = left.mergeWithConflicts(
                                         MemoryManifestEntry::convertTreenode(right), ctx_,
                                         RepoPath::root())
                                     .get();
    NodeHash savedLeft = putTree(seed(), {entry(a)});
    EXPECT_EQ(merged.tree()->p1, savedLeft);
    EXPECT_EQ(merged.tree()->p2, right);
    EXPECT_EQ(merged.getNewChildren(ctx_).get().size(), 2u);
}

TEST_P(MemoryManifestTest, ModifiedOtherSideIsSavedBeforeMerging) {
    NodeHash left = putTree(seed(), {entry(leaf(seed(), "a", "a"))});
    MemoryManifestEntry right = MemoryManifestEntry::emptyTree();
    BlobEntry b = leaf(seed(), "b", "b");
    right.change(b.name().value(), b);

    MemoryManifestEntry merged = MemoryManifestEntry::convertTreenode(left)
                                     .mergeWithConflicts(right, ctx_, RepoPath::root())
                                     .get();
    NodeHash savedRight = putTree(seed(), {entry(b)});
    EXPECT_EQ(merged.tree()->p1, left);
    EXPECT_EQ(merged.tree()->p2, savedRight);
    ChildMap children = merged.getNewChildren(ctx_).get();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_TRUE(children.at(MPathElement("a")).isBlob());
    EXPECT_TRUE(children.at(MPathElement("b")).isBlob());
}

TEST_P(MemoryManifestTest, ConcurrentDescentsCoerceConflictOnce) {
    NodeHash t1 = putTree(seed(), {entry(leaf(seed(), "x", "1"))});
    NodeHash t2 = putTree(seed(), {entry(leaf(seed(), "y", "2"))});
    MemoryManifestEntry conflict(ConflictSet{{MemoryManifestEntry::convertTreenode(t1),
                                              MemoryManifestEntry::convertTreenode(t2)}});
    MemoryManifestEntry root = MemoryManifestEntry::memTree(
        std::nullopt, std::nullopt, std::nullopt, {{MPathElement("d"), conflict}});

    std::vector<std::future<std::optional<MemoryManifestEntry>>> walks;
    for (int i = 0; i < 8; ++i) {
        walks.push_back(
            root.findMut({MPathElement("d"), MPathElement("n" + std::to_string(i))}, ctx_));
    }
    for (auto& w : walks) {
        auto found = w.get();
        ASSERT_TRUE(found);
        EXPECT_TRUE(found->isDir());
    }
    EXPECT_EQ(metrics_.counterValue(metric_names::CONFLICT_COERCIONS), 1);
    EXPECT_TRUE(root.conflicts(RepoPath::root()).empty());
    EXPECT_EQ(ctx_.fanout->inUse(), 0u);
}

TEST_P(MemoryManifestTest, SavingUntouchedMergeResultFails) {
    NodeHash p1 = putTree(seed(), {entry(leaf(seed(), "a", "1"))});
    NodeHash p2 = putTree(seed(), {entry(leaf(seed(), "b", "2"))});
    MemoryManifestEntry merged = MemoryManifestEntry::memTree(p1, p1, p2);
    EXPECT_THROW(merged.save(ctx_, RepoPath::root()).get(), UnchangedManifest);
}

TEST_P(MemoryManifestTest, SavingConflictFails) {
    MemoryManifestEntry a(leaf(seed(), "f", "1"));
    MemoryManifestEntry b(leaf(seed(), "f", "2"));
    MemoryManifestEntry tree = MemoryManifestEntry::memTree(
        std::nullopt, std::nullopt, std::nullopt,
        {{MPathElement("f"), MemoryManifestEntry(ConflictSet{{a, b}})}});
    EXPECT_THROW(tree.save(ctx_, RepoPath::root()).get(), UnresolvedConflicts);
}

TEST_P(MemoryManifestTest, SaveDropsEmptyDirectories) {
    MemoryManifestEntry root = MemoryManifestEntry::emptyTree();
    ASSERT_TRUE(root.findMut({MPathElement("x"), MPathElement("y")}, ctx_).get());
    BlobEntry f = leaf(seed(), "f", "content");
    root.change(MPathElement("f"), f);

    BlobEntry saved = root.save(ctx_, RepoPath::root()).get();
    auto listing = TreeManifest::load(seed(), saved.hash());
    ASSERT_TRUE(listing);
    ASSERT_EQ(listing->size(), 1u);
    EXPECT_EQ(listing->list()[0].name.str(), "f");
    EXPECT_EQ(metrics_.counterValue("mosaic_tree_writes_total"), 1);
}

TEST_P(MemoryManifestTest, EmptyRootStillSaves) {
    BlobEntry saved = MemoryManifestEntry::emptyTree().save(ctx_, RepoPath::root()).get();
    auto raw = seed().get(saved.hash());
    ASSERT_TRUE(raw);
    EXPECT_TRUE(raw->empty());
}

TEST_P(MemoryManifestTest, SavedChildCarriesItsName) {
    MemoryManifestEntry dir = MemoryManifestEntry::emptyTree();
    dir.change(MPathElement("f"), leaf(seed(), "f", "1"));
    BlobEntry saved = dir.save(ctx_, RepoPath::dir(MPath("a/b"))).get();
    ASSERT_TRUE(saved.name());
    EXPECT_EQ(saved.name()->str(), "b");
    EXPECT_EQ(saved.type(), EntryType::Tree);
}

TEST_P(MemoryManifestTest, FindMutStopsAtLeaf) {
    MemoryManifestEntry root = MemoryManifestEntry::emptyTree();
    root.change(MPathElement("f"), leaf(seed(), "f", "1"));
    auto found = root.findMut({MPathElement("f"), MPathElement("below")}, ctx_).get();
    EXPECT_FALSE(found);

    auto leafItself = root.findMut({MPathElement("f")}, ctx_).get();
    ASSERT_TRUE(leafItself);
    EXPECT_TRUE(leafItself->isBlob());
}

TEST_P(MemoryManifestTest, FindMutRecreatesDeletedDirectory) {
    NodeHash sub = putTree(seed(), {entry(leaf(seed(), "x", "1"))});
    NodeHash base = putTree(seed(), {treeEntry("d", sub)});
    MemoryManifestEntry root = MemoryManifestEntry::convertTreenode(base);
    root.change(MPathElement("d"), std::nullopt);

    auto found = root.findMut({MPathElement("d")}, ctx_).get();
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->isDir());
    EXPECT_FALSE(found->tree()->base);
    EXPECT_TRUE(found->isEmpty(ctx_).get());
}

TEST_P(MemoryManifestTest, FindMutSeedsBaselineEntry) {
    NodeHash sub = putTree(seed(), {entry(leaf(seed(), "x", "1"))});
    NodeHash base = putTree(seed(), {treeEntry("d", sub), entry(leaf(seed(), "f", "2"))});
    MemoryManifestEntry root = MemoryManifestEntry::convertTreenode(base);

    auto found = root.findMut({MPathElement("d")}, ctx_).get();
    ASSERT_TRUE(found);
    EXPECT_EQ(found->tree()->base, sub);

    ChangeMap changes = root.changesSnapshot();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_TRUE(changes.count(MPathElement("d")));
    EXPECT_EQ(metrics_.counterValue("mosaic_manifest_lookups_total"), 1);
}

TEST_P(MemoryManifestTest, FindMutCoercesConflictIntoTwoParentTree) {
    NodeHash t1 = putTree(seed(), {entry(leaf(seed(), "x", "1"))});
    NodeHash t2 = putTree(seed(), {entry(leaf(seed(), "y", "2"))});
    MemoryManifestEntry conflict(ConflictSet{
        {MemoryManifestEntry::convertTreenode(t1),
         MemoryManifestEntry(leaf(seed(), "d", "plain file")),
         MemoryManifestEntry(BlobEntry(MPathElement("d"), t2, EntryType::Tree))}});
    MemoryManifestEntry root = MemoryManifestEntry::memTree(
        std::nullopt, std::nullopt, std::nullopt, {{MPathElement("d"), conflict}});
    ASSERT_EQ(root.conflicts(RepoPath::root()).size(), 1u);

    auto found = root.findMut({MPathElement("d")}, ctx_).get();
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->isDir());
    EXPECT_FALSE(found->tree()->base);
    EXPECT_EQ(found->tree()->p1, t1);
    EXPECT_EQ(found->tree()->p2, t2);
    EXPECT_TRUE(root.conflicts(RepoPath::root()).empty());
    EXPECT_EQ(metrics_.counterValue("mosaic_conflict_coercions_total"), 1);
}

TEST_P(MemoryManifestTest, CoercionKeepsFirstTwoTreeCandidates) {
    NodeHash t1 = putTree(seed(), {entry(leaf(seed(), "a", "1"))});
    NodeHash t2 = putTree(seed(), {entry(leaf(seed(), "b", "2"))});
    NodeHash t3 = putTree(seed(), {entry(leaf(seed(), "c", "3"))});
    MemoryManifestEntry conflict(ConflictSet{{MemoryManifestEntry::convertTreenode(t1),
                                              MemoryManifestEntry::convertTreenode(t2),
                                              MemoryManifestEntry::convertTreenode(t3)}});
    MemoryManifestEntry root = MemoryManifestEntry::memTree(
        std::nullopt, std::nullopt, std::nullopt, {{MPathElement("d"), conflict}});

    auto found = root.findMut({MPathElement("d")}, ctx_).get();
    ASSERT_TRUE(found);
    EXPECT_EQ(found->tree()->p1, t1);
    EXPECT_EQ(found->tree()->p2, t2);
}

TEST_P(MemoryManifestTest, LocateDoesNotRecordAnything) {
    BlobEntry x = leaf(seed(), "x", "1");
    NodeHash sub = putTree(seed(), {entry(x)});
    NodeHash base = putTree(seed(), {treeEntry("d", sub)});
    MemoryManifestEntry root = MemoryManifestEntry::convertTreenode(base);

    auto found = root.locate({MPathElement("d"), MPathElement("x")}, ctx_).get();
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->isBlob());
    EXPECT_EQ(*found->blob(), x);
    EXPECT_FALSE(root.locate({MPathElement("d"), MPathElement("nope")}, ctx_).get());
    EXPECT_FALSE(root.isModified());
}

TEST_P(MemoryManifestTest, ConflictsReportsNestedPaths) {
    MemoryManifestEntry a(leaf(seed(), "f", "1"));
    MemoryManifestEntry b(leaf(seed(), "f", "2"));
    MemoryManifestEntry inner = MemoryManifestEntry::memTree(
        std::nullopt, std::nullopt, std::nullopt,
        {{MPathElement("f"), MemoryManifestEntry(ConflictSet{{a, b}})}});
    MemoryManifestEntry root = MemoryManifestEntry::memTree(
        std::nullopt, std::nullopt, std::nullopt, {{MPathElement("dir"), inner}});

    auto conflicts = root.conflicts(RepoPath::root());
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].toString(), "dir/f");
    EXPECT_EQ(conflicts[0].kind(), RepoPath::Kind::File);
}

INSTANTIATE_TEST_SUITE_P(LaunchPolicy, MemoryManifestTest, ::testing::Bool(),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Parallel")
                                               : std::string("Inline");
                         });
