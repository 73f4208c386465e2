/*
 * Arbor - Nested Sets Tree Storage
 * Copyright (C) 2026 Arbor Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "../src/Tree/NestedSet.hpp"

#include <memory>

namespace {

    struct Category {
        std::string name;
        int64_t priority = 0;
    };

} // anonymous namespace

namespace Arbor {
namespace Tree {

template <>
struct RecordTraits<Category> {
    static TableMapping Mapping() {
        TableMapping mapping;
        mapping.table = "categories";
        mapping.attributes = {
            { "name", ColumnType::Text, false },
            { "priority", ColumnType::Integer, false },
        };
        return mapping;
    }

    static Attributes ToAttributes(const Category& c) {
        return {
            { "name", AttributeValue{ c.name } },
            { "priority", AttributeValue{ c.priority } },
        };
    }

    static Category FromAttributes(const Attributes& attrs) {
        Category c;
        if (const auto* v = FindAttribute(attrs, "name"); v && std::holds_alternative<std::string>(*v)) {
            c.name = std::get<std::string>(*v);
        }
        if (const auto* v = FindAttribute(attrs, "priority"); v && std::holds_alternative<int64_t>(*v)) {
            c.priority = std::get<int64_t>(*v);
        }
        return c;
    }
};

} // namespace Tree
} // namespace Arbor

using namespace Arbor;
using namespace Arbor::Tree;

class NestedSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_db = std::make_unique<Database::DatabaseManager>();
        Database::DatabaseError dbErr;
        ASSERT_TRUE(m_db->Initialize(Testing::MakeTestConfig(m_path.Path()), &dbErr)) << dbErr.message;

        m_tree = std::make_unique<NestedSet<Category>>(*m_db);
        TreeError err;
        ASSERT_TRUE(m_tree->Initialize(&err)) << err.ToString();
    }

    void TearDown() override {
        m_tree.reset();
        m_db.reset();
    }

    Testing::TempDatabasePath m_path;
    std::unique_ptr<Database::DatabaseManager> m_db;
    std::unique_ptr<NestedSet<Category>> m_tree;
};

TEST_F(NestedSetTest, RecordsRoundTripThroughTraits) {
    TreeError err;
    auto root = m_tree->CreateRoot(Category{ "Electronics", 3 }, &err);
    ASSERT_TRUE(root.has_value()) << err.ToString();
    EXPECT_EQ(root->record.name, "Electronics");
    EXPECT_EQ(root->record.priority, 3);
    EXPECT_EQ(root->handle.boundary, (Boundary{ 1, 2 }));

    auto fetched = m_tree->GetNode(root->handle.id, &err);
    ASSERT_TRUE(fetched.has_value()) << err.ToString();
    EXPECT_EQ(fetched->record.name, "Electronics");
    EXPECT_EQ(fetched->record.priority, 3);
}

TEST_F(NestedSetTest, CategoryHierarchy) {
    TreeError err;
    auto electronics = m_tree->CreateRoot(Category{ "Electronics" }, &err);
    ASSERT_TRUE(electronics.has_value()) << err.ToString();

    auto phones = m_tree->AddChild(electronics->handle, Category{ "Phones" }, &err);
    auto laptops = m_tree->AddChild(electronics->handle, Category{ "Laptops" }, &err);
    ASSERT_TRUE(phones && laptops) << err.ToString();

    auto android = m_tree->AddChild(phones->handle, Category{ "Android" }, &err);
    ASSERT_TRUE(android.has_value()) << err.ToString();

    auto ancestors = m_tree->AncestorsOf(android->handle, &err);
    ASSERT_TRUE(ancestors.has_value()) << err.ToString();
    ASSERT_EQ(ancestors->size(), 2u);
    EXPECT_EQ((*ancestors)[0].record.name, "Electronics");
    EXPECT_EQ((*ancestors)[1].record.name, "Phones");

    std::optional<TreeNode<Category>> parent;
    ASSERT_TRUE(m_tree->ParentOf(laptops->handle, parent, &err)) << err.ToString();
    ASSERT_TRUE(parent.has_value());
    EXPECT_EQ(parent->record.name, "Electronics");

    auto text = m_tree->RenderForest(&err);
    ASSERT_TRUE(text.has_value()) << err.ToString();
    EXPECT_EQ(*text,
        "Electronics [1, 8]\n"
        "    Phones [2, 5]\n"
        "        Android [3, 4]\n"
        "    Laptops [6, 7]\n");
}

TEST_F(NestedSetTest, SavePersistsRecordChanges) {
    TreeError err;
    auto root = m_tree->CreateRoot(Category{ "Books", 1 }, &err);
    ASSERT_TRUE(root.has_value()) << err.ToString();

    root->record.priority = 9;
    root->record.name = "Printed Books";
    ASSERT_TRUE(m_tree->Save(*root, &err)) << err.ToString();

    auto fetched = m_tree->GetNode(root->handle.id, &err);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->record.name, "Printed Books");
    EXPECT_EQ(fetched->record.priority, 9);
}

TEST_F(NestedSetTest, AddChildrenAndMoveKeepTreeConsistent) {
    TreeError err;
    auto root = m_tree->CreateRoot(Category{ "Root" }, &err);
    ASSERT_TRUE(root.has_value()) << err.ToString();

    auto kids = m_tree->AddChildren(root->handle, { Category{ "a" }, Category{ "b" }, Category{ "c" } }, &err);
    ASSERT_TRUE(kids.has_value()) << err.ToString();
    ASSERT_EQ(kids->size(), 3u);

    ASSERT_TRUE(m_tree->MoveInside((*kids)[2].handle, (*kids)[0].handle, &err)) << err.ToString();

    auto children = m_tree->ChildrenOf(root->handle, &err);
    ASSERT_TRUE(children.has_value());
    ASSERT_EQ(children->size(), 2u);
    EXPECT_EQ((*children)[0].record.name, "a");
    EXPECT_EQ((*children)[1].record.name, "b");

    EXPECT_EQ(m_tree->DepthOf((*kids)[2].handle, &err), std::optional<int64_t>(2));

    std::vector<std::string> issues;
    ASSERT_TRUE(m_tree->CheckInvariants(issues, &err)) << err.ToString();
    EXPECT_TRUE(issues.empty());
}

TEST_F(NestedSetTest, DeleteMarksHandleDeleted) {
    TreeError err;
    auto root = m_tree->CreateRoot(Category{ "Root" }, &err);
    auto child = m_tree->AddChild(root->handle, Category{ "Child" }, &err);
    ASSERT_TRUE(child.has_value()) << err.ToString();

    ASSERT_TRUE(m_tree->DeleteSubtree(child->handle, &err)) << err.ToString();
    EXPECT_EQ(child->handle.state, NodeState::Deleted);

    EXPECT_FALSE(m_tree->Save(*child, &err));
    EXPECT_EQ(err.kind, TreeErrorKind::InvalidState);

    ASSERT_TRUE(m_tree->Refresh(root->handle, &err)) << err.ToString();
    EXPECT_EQ(root->handle.boundary, (Boundary{ 1, 2 }));
}

TEST_F(NestedSetTest, PositionalInsertAndMove) {
    TreeError err;
    auto root = m_tree->CreateRoot(Category{ "Root" }, &err);
    ASSERT_TRUE(root.has_value()) << err.ToString();

    auto a = m_tree->Insert(root->handle, MovePosition::LastChild, Category{ "a" }, &err);
    ASSERT_TRUE(a.has_value()) << err.ToString();
    auto c = m_tree->Insert(a->handle, MovePosition::After, Category{ "c", 7 }, &err);
    ASSERT_TRUE(c.has_value()) << err.ToString();
    auto first = m_tree->Insert(a->handle, MovePosition::Before, Category{ "first" }, &err);
    ASSERT_TRUE(first.has_value()) << err.ToString();

    auto all = m_tree->AllNodes(&err);
    ASSERT_TRUE(all.has_value()) << err.ToString();
    ASSERT_EQ(all->size(), 4u);
    EXPECT_EQ((*all)[0].record.name, "Root");
    EXPECT_EQ((*all)[1].record.name, "first");
    EXPECT_EQ((*all)[2].record.name, "a");
    EXPECT_EQ((*all)[3].record.name, "c");
    EXPECT_EQ((*all)[3].record.priority, 7);

    ASSERT_TRUE(m_tree->Refresh(first->handle, &err)) << err.ToString();
    ASSERT_TRUE(m_tree->Move(c->handle, first->handle, MovePosition::FirstChild, &err)) << err.ToString();
    EXPECT_EQ(m_tree->DepthOf(c->handle, &err), std::optional<int64_t>(2));

    all = m_tree->AllNodes(&err);
    ASSERT_TRUE(all.has_value()) << err.ToString();
    ASSERT_EQ(all->size(), 4u);
    EXPECT_EQ((*all)[1].record.name, "first");
    EXPECT_EQ((*all)[2].record.name, "c");
    EXPECT_EQ((*all)[3].record.name, "a");
    EXPECT_EQ((*all)[0].handle.boundary, (Boundary{ 1, 8 }));

    std::vector<std::string> issues;
    ASSERT_TRUE(m_tree->CheckInvariants(issues, &err)) << err.ToString();
    EXPECT_TRUE(issues.empty());
}
