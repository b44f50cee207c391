#include <gtest/gtest.h>

#include "ancestorpath.h"
#include "testing/fakeelement.h"
#include "testing/testcontext.h"


class AncestorPathTest : public ::testing::Test
{
    protected:
        TestContext m_context{LogLevel::NONE};
        AncestorPathResolver m_resolver{m_context, Config::MAX_ANCESTOR_DEPTH};
};

TEST_F(AncestorPathTest, ParentlessElementHasEmptyPath)
{
    auto root = FakeElement::make(m_context, "Desktop", "ControlType.Pane");
    EXPECT_TRUE(m_resolver.resolve(root).empty());
    EXPECT_TRUE(m_resolver.resolve(nullptr).empty());
}

TEST_F(AncestorPathTest, RootMostFirst)
{
    auto desktop = FakeElement::make(m_context, "Desktop", "ControlType.Pane");
    auto window = FakeElement::make(m_context, "Untitled - gedit", "ControlType.Window", 100, desktop);
    auto panel = FakeElement::make(m_context, "", "ControlType.Panel", 100, window);
    auto button = FakeElement::make(m_context, "Save", "ControlType.Button", 100, panel);

    std::vector<std::string> expected{"Desktop", "Untitled - gedit", "ControlType.Panel"};
    EXPECT_EQ(expected, m_resolver.resolve(button));
}

TEST_F(AncestorPathTest, UnnamedWithoutControlTypeIsUnknown)
{
    auto parent = FakeElement::make(m_context, "");
    parent->control_type = PropertyError::STALE_ELEMENT;
    auto child = FakeElement::make(m_context, "child", "ControlType.Button", 100, parent);

    std::vector<std::string> expected{"ControlType.Unknown"};
    EXPECT_EQ(expected, m_resolver.resolve(child));
}

TEST_F(AncestorPathTest, CappedAtMaxDepth)
{
    // parent links forming a cycle must not loop forever
    auto a = FakeElement::make(m_context, "a");
    auto b = FakeElement::make(m_context, "b", "ControlType.Button", 100, a);
    a->parent = UIElementPtr(b);

    auto path = m_resolver.resolve(a);
    EXPECT_EQ(10u, path.size());
    EXPECT_EQ("a", path.front());
    EXPECT_EQ("b", path.back());

    a->parent = UIElementPtr();   // break the reference cycle
}

TEST_F(AncestorPathTest, DeepTreeKeepsNearestAncestors)
{
    UIElementPtr parent;
    for (int i = 0; i < 15; i++)
        parent = FakeElement::make(m_context, "level" + std::to_string(i),
                                   "ControlType.Pane", 100, parent);
    auto leaf = FakeElement::make(m_context, "leaf", "ControlType.Button", 100, parent);

    auto path = m_resolver.resolve(leaf);
    ASSERT_EQ(10u, path.size());
    EXPECT_EQ("level5", path.front());
    EXPECT_EQ("level14", path.back());
}

TEST_F(AncestorPathTest, FailedReadReturnsPrefix)
{
    auto gone = FakeElement::make(m_context, "gone");
    gone->parent = PropertyError::STALE_ELEMENT;
    auto window = FakeElement::make(m_context, "Window", "ControlType.Window", 100, gone);
    auto button = FakeElement::make(m_context, "OK", "ControlType.Button", 100, window);

    std::vector<std::string> expected{"gone", "Window"};
    EXPECT_EQ(expected, m_resolver.resolve(button));
}

TEST_F(AncestorPathTest, SmallerDepthLimit)
{
    AncestorPathResolver resolver(m_context, 1);
    auto root = FakeElement::make(m_context, "root");
    auto window = FakeElement::make(m_context, "Window", "ControlType.Window", 100, root);
    auto button = FakeElement::make(m_context, "OK", "ControlType.Button", 100, window);

    std::vector<std::string> expected{"Window"};
    EXPECT_EQ(expected, resolver.resolve(button));
}
