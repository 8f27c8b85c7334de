#include <gtest/gtest.h>
#include "core/PathError.h"
#include "core/SiblingLocator.h"

using namespace xpathgen;

namespace {

// <parent/> as the document element of a fresh document.
struct ParentFixture {
    std::unique_ptr<XmlNode> doc = XmlNode::makeDocument();
    XmlNode* parent = doc->addChild(XmlNode::makeElement("parent"));
};

} // namespace

TEST(SiblingLocatorTest, SimpleChildNo) {
    ParentFixture f;
    XmlNode* a = f.parent->addChild(XmlNode::makeElement("a"));
    XmlNode* b = f.parent->addChild(XmlNode::makeElement("b"));
    XmlNode* c = f.parent->addChild(XmlNode::makeElement("c"));

    EXPECT_EQ(SiblingLocator(a).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(b).childNumber(), 2);
    EXPECT_EQ(SiblingLocator(c).childNumber(), 3);
    EXPECT_FALSE(SiblingLocator(b).charOffset().has_value());
}

TEST(SiblingLocatorTest, AdjacentTextCoalesces) {
    ParentFixture f;
    XmlNode* a = f.parent->addChild(XmlNode::makeText("a"));
    XmlNode* b = f.parent->addChild(XmlNode::makeText("b"));

    SiblingIndex ia = SiblingLocator::indexOf(a);
    SiblingIndex ib = SiblingLocator::indexOf(b);
    EXPECT_EQ(ia.childNumber, 1);
    EXPECT_EQ(ib.childNumber, 1);
    EXPECT_EQ(ia.charOffset.value_or(0), 1);
    EXPECT_EQ(ib.charOffset.value_or(0), 2);
}

TEST(SiblingLocatorTest, TextNodeChildNo) {
    // <parent>""<a/>12<!--d-->3</parent>
    ParentFixture f;
    XmlNode* blank = f.parent->addChild(XmlNode::makeText(""));
    XmlNode* a = f.parent->addChild(XmlNode::makeElement("a"));
    XmlNode* one = f.parent->addChild(XmlNode::makeText("1"));
    XmlNode* two = f.parent->addChild(XmlNode::makeText("2"));
    XmlNode* d = f.parent->addChild(XmlNode::makeComment("d"));
    XmlNode* three = f.parent->addChild(XmlNode::makeText("3"));

    SiblingLocator la(a), l1(one), l2(two), ld(d), l3(three);

    // The blank node does not exist for XPath, so <a/> is node()[1].
    EXPECT_EQ(la.childNumber(), 1);
    EXPECT_EQ(l1.childNumber(), 2);
    EXPECT_EQ(l2.childNumber(), 2);
    EXPECT_EQ(ld.childNumber(), 3);
    EXPECT_EQ(l3.childNumber(), 4);

    EXPECT_EQ(l1.charOffset().value_or(0), 1);
    EXPECT_EQ(l2.charOffset().value_or(0), 2);
    EXPECT_EQ(l3.charOffset().value_or(0), 1);

    // Never gets a number of its own.
    EXPECT_LT(SiblingLocator(blank).childNumber(), la.childNumber());
}

TEST(SiblingLocatorTest, TwoInitialTextNodes) {
    ParentFixture f;
    XmlNode* a = f.parent->addChild(XmlNode::makeText("1234"));
    XmlNode* b = f.parent->addChild(XmlNode::makeText("5"));
    XmlNode* c = f.parent->addChild(XmlNode::makeElement("a"));

    EXPECT_EQ(SiblingLocator(a).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(a).charOffset().value_or(0), 1);
    EXPECT_EQ(SiblingLocator(b).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(b).charOffset().value_or(0), 5);
    EXPECT_EQ(SiblingLocator(c).childNumber(), 2);
}

TEST(SiblingLocatorTest, CDataJoinsTextRun) {
    // <p>xxx<![CDATA[yyy]]>zzz<br/></p>
    ParentFixture f;
    XmlNode* x = f.parent->addChild(XmlNode::makeText("xxx"));
    XmlNode* y = f.parent->addChild(XmlNode::makeCData("yyy"));
    XmlNode* z = f.parent->addChild(XmlNode::makeText("zzz"));
    XmlNode* br = f.parent->addChild(XmlNode::makeElement("br"));

    EXPECT_EQ(SiblingLocator(x).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(y).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(z).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(y).charOffset().value_or(0), 4);
    EXPECT_EQ(SiblingLocator(z).charOffset().value_or(0), 7);
    EXPECT_EQ(SiblingLocator(br).childNumber(), 2);
}

TEST(SiblingLocatorTest, EmptyTextInsideRunDoesNotSplitIt) {
    ParentFixture f;
    XmlNode* a = f.parent->addChild(XmlNode::makeText("ab"));
    f.parent->addChild(XmlNode::makeText(""));
    XmlNode* c = f.parent->addChild(XmlNode::makeText("c"));

    EXPECT_EQ(SiblingLocator(a).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(c).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(c).charOffset().value_or(0), 3);
}

TEST(SiblingLocatorTest, EmptyTextAfterElementDoesNotStartRun) {
    // XPath sees <e/> followed by the text "y".
    ParentFixture f;
    XmlNode* e = f.parent->addChild(XmlNode::makeElement("e"));
    f.parent->addChild(XmlNode::makeText(""));
    XmlNode* y = f.parent->addChild(XmlNode::makeText("y"));

    EXPECT_EQ(SiblingLocator(e).childNumber(), 1);
    EXPECT_EQ(SiblingLocator(y).childNumber(), 2);
    EXPECT_EQ(SiblingLocator(y).charOffset().value_or(0), 1);
}

TEST(SiblingLocatorTest, SoleEmptyTextIsNotAddressable) {
    ParentFixture f;
    XmlNode* blank = f.parent->addChild(XmlNode::makeText(""));

    // No countable anchor precedes it; the arithmetic bottoms out at 0.
    EXPECT_EQ(SiblingLocator(blank).childNumber(), 0);
}

TEST(SiblingLocatorTest, DocumentTypeIsNotCounted) {
    auto doc = XmlNode::makeDocument();
    doc->addChild(XmlNode::makeComment(" prolog "));
    doc->addChild(XmlNode::makeDocumentType("a"));
    XmlNode* root = doc->addChild(XmlNode::makeElement("a"));

    EXPECT_EQ(SiblingLocator(root).childNumber(), 2);
}

TEST(SiblingLocatorTest, CharOffsetCountsCharacters) {
    ParentFixture f;
    f.parent->addChild(XmlNode::makeText("caf\xC3\xA9"));
    XmlNode* second = f.parent->addChild(XmlNode::makeText("!"));

    EXPECT_EQ(SiblingLocator(second).charOffset().value_or(0), 5);
}

TEST(SiblingLocatorTest, SnapshotIgnoresLaterMutation) {
    ParentFixture f;
    f.parent->addChild(XmlNode::makeElement("a"));
    XmlNode* b = f.parent->addChild(XmlNode::makeElement("b"));

    SiblingLocator locator(b);
    EXPECT_EQ(locator.snapshot().size(), 2u);

    f.parent->addChild(XmlNode::makeElement("c"));
    EXPECT_EQ(locator.snapshot().size(), 2u);
    EXPECT_EQ(locator.childNumber(), 2);
}

TEST(SiblingLocatorTest, IndexIsMemoized) {
    ParentFixture f;
    XmlNode* a = f.parent->addChild(XmlNode::makeText("a"));

    SiblingLocator locator(a);
    const SiblingIndex& first = locator.index();
    const SiblingIndex& second = locator.index();
    EXPECT_EQ(&first, &second);
}

TEST(SiblingLocatorTest, SnapshotFromExplicitList) {
    auto e = XmlNode::makeElement("e");
    auto t1 = XmlNode::makeText("t1");
    auto t2 = XmlNode::makeText("t2");

    SiblingSnapshot snapshot({e.get(), t1.get(), t2.get()}, 2);
    EXPECT_TRUE(snapshot.countable(0));
    EXPECT_TRUE(snapshot.countable(1));
    EXPECT_FALSE(snapshot.countable(2));
    EXPECT_EQ(snapshot.target(), t2.get());

    SiblingLocator locator(std::move(snapshot));
    EXPECT_EQ(locator.childNumber(), 2);
    EXPECT_EQ(locator.charOffset().value_or(0), 3);

    EXPECT_THROW(SiblingSnapshot({e.get()}, 1), InvalidArgumentError);
    std::vector<const XmlNode*> withNull = {e.get(), nullptr};
    EXPECT_THROW(SiblingSnapshot(withNull, 0), InvalidArgumentError);
}

TEST(SiblingLocatorTest, NullThrows) {
    EXPECT_THROW(SiblingLocator(static_cast<const XmlNode*>(nullptr)), InvalidArgumentError);
}

TEST(SiblingLocatorTest, ChildWithNoParentThrows) {
    auto child = XmlNode::makeElement("noparent");
    try {
        SiblingLocator locator(child.get());
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.code(), PATH_INVALID_ARGUMENT);
        EXPECT_STREQ(e.codeName(), "InvalidArgument");
    }
}
