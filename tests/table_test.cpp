// table_test.cpp - Row-by-row table placement and header repetition

#include <gtest/gtest.h>

#include "document.h"
#include "recordingcanvas.h"
#include "testhelpers.h"

using namespace TestHelpers;

namespace {

int countText(const RecordedPage &page, const QString &text)
{
    return page.texts().count(text);
}

QList<Layout::BlockPlacement> rowPlacements(const Layout::LayoutResult &result, int page)
{
    QList<Layout::BlockPlacement> rows;
    for (const Layout::BlockPlacement &p : result.placementsOnPage(page)) {
        if (p.row >= 0)
            rows.append(p);
    }
    return rows;
}

} // namespace

class TableLayoutTest : public ::testing::Test {
protected:
    PageLayout layout;
    Report::Theme theme = Report::Theme::defaultTheme();
    RecordingCanvas canvas;
};

TEST_F(TableLayoutTest, SmallTableDrawsEveryCell) {
    Report::Document doc(layout, theme);
    ASSERT_TRUE(doc.addSection(QString(), {table(3)}));

    ASSERT_TRUE(doc.render(&canvas));
    ASSERT_EQ(canvas.pages().size(), 1);

    int rects = 0;
    for (const DrawOp &op : canvas.pages()[0].ops) {
        if (op.kind == DrawOp::Rect)
            ++rects;
    }
    EXPECT_EQ(rects, 4 * 2); // header + 3 rows, 2 columns
    EXPECT_EQ(countText(canvas.pages()[0], QStringLiteral("Name")), 1);
    EXPECT_EQ(countText(canvas.pages()[0], QStringLiteral("Row 2")), 1);
}

TEST_F(TableLayoutTest, CellsUseGridColumnsAndPadding) {
    Report::Document doc(layout, theme);
    ASSERT_TRUE(doc.addSection(QString(), {table(1)}));

    ASSERT_TRUE(doc.render(&canvas));
    const RecordedPage &page = canvas.pages()[0];

    QList<DrawOp> rects;
    for (const DrawOp &op : page.ops) {
        if (op.kind == DrawOp::Rect)
            rects.append(op);
    }
    ASSERT_EQ(rects.size(), 4);
    const Report::TableBlock defaults;
    // Header row, first column
    EXPECT_EQ(rects[0].rect, QRectF(50.0, 742.0 - 18.0, 200.0, 18.0));
    EXPECT_EQ(rects[0].fill, defaults.headerBackground);
    EXPECT_EQ(rects[0].stroke, defaults.gridColor);
    // Header row, second column
    EXPECT_EQ(rects[1].rect, QRectF(250.0, 742.0 - 18.0, 100.0, 18.0));
    // Body row has no background by default
    EXPECT_FALSE(rects[2].fill.isValid());

    const QList<DrawOp> texts = page.textOps();
    ASSERT_GE(texts.size(), 4);
    EXPECT_EQ(texts[0].text, QStringLiteral("Name"));
    EXPECT_DOUBLE_EQ(texts[0].p1.x(), 54.0);
    EXPECT_EQ(texts[0].style, theme.style(Report::Roles::TableHeader));
    EXPECT_EQ(texts[1].text, QStringLiteral("Count"));
    EXPECT_DOUBLE_EQ(texts[1].p1.x(), 254.0);
    EXPECT_EQ(texts[2].style, theme.style(Report::Roles::TableCell));
}

TEST_F(TableLayoutTest, HeaderRepeatsOnceOnContinuationPage) {
    Report::Document doc(layout, theme);
    // 40 lines leave 92 pt: header + 4 rows fit, 6 rows continue
    ASSERT_TRUE(doc.addSection(QString(), {numberedLines(40), table(10)}));

    ASSERT_TRUE(doc.render(&canvas));
    ASSERT_EQ(canvas.pages().size(), 2);

    EXPECT_EQ(rowPlacements(doc.lastLayout(), 0).size(), 4);
    const QList<Layout::BlockPlacement> continued = rowPlacements(doc.lastLayout(), 1);
    ASSERT_EQ(continued.size(), 6);
    EXPECT_EQ(continued.first().row, 4);
    // Header occupies the first row slot on the new page
    EXPECT_DOUBLE_EQ(continued.first().y, 742.0 - 18.0);

    EXPECT_EQ(countText(canvas.pages()[0], QStringLiteral("Name")), 1);
    EXPECT_EQ(countText(canvas.pages()[1], QStringLiteral("Name")), 1);

    const QStringList second = canvas.pages()[1].texts();
    EXPECT_EQ(second[0], QStringLiteral("(continued)"));
    EXPECT_EQ(second[1], QStringLiteral("Name"));
}

TEST_F(TableLayoutTest, HeaderIsNeverStrandedAtPageBottom) {
    Report::Document doc(layout, theme);
    // 45 lines leave 17 pt: not even the header fits with a row
    ASSERT_TRUE(doc.addSection(QString(), {numberedLines(45), table(10)}));

    ASSERT_TRUE(doc.render(&canvas));
    ASSERT_EQ(canvas.pages().size(), 2);
    EXPECT_EQ(countText(canvas.pages()[0], QStringLiteral("Name")), 0);
    EXPECT_EQ(countText(canvas.pages()[1], QStringLiteral("Name")), 1);
    EXPECT_EQ(rowPlacements(doc.lastLayout(), 1).size(), 10);
}

TEST_F(TableLayoutTest, HeaderlessTableFlowsAcrossPages) {
    Report::Document doc(layout, theme);
    ASSERT_TRUE(doc.addSection(QString(), {table(100, false)})); // 38 rows per page

    ASSERT_TRUE(doc.render(&canvas));
    ASSERT_EQ(canvas.pages().size(), 3);
    EXPECT_EQ(rowPlacements(doc.lastLayout(), 0).size(), 38);
    EXPECT_EQ(rowPlacements(doc.lastLayout(), 1).size(), 38);
    EXPECT_EQ(rowPlacements(doc.lastLayout(), 2).size(), 24);
}

TEST_F(TableLayoutTest, StyleBeforeBreakIsTheCellStyle) {
    Report::Document doc(layout, theme);
    ASSERT_TRUE(doc.addSection(QString(), {numberedLines(40), table(10)}));

    ASSERT_TRUE(doc.render(&canvas));
    const QList<DrawOp> ops = canvas.pages()[1].textOps();
    ASSERT_FALSE(ops.isEmpty());
    EXPECT_EQ(ops[0].style, theme.style(Report::Roles::TableCell));
}

TEST_F(TableLayoutTest, HeaderPlusRowTallerThanPageFails) {
    Report::Document doc(layout, theme);
    ASSERT_TRUE(doc.addSection(QString(), {table(2, true, 400.0)}));

    EXPECT_FALSE(doc.render(&canvas));
    EXPECT_EQ(doc.lastError().code, Report::ErrorCode::BlockTooLargeError);
    EXPECT_EQ(doc.lastError().blockIndex, 0);
    EXPECT_TRUE(canvas.wasAborted());
}

TEST_F(TableLayoutTest, RowsWiderThanColumnsAreRejectedOnAppend) {
    Report::TableBlock bad = table(2);
    bad.rows.append(QStringList{QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")});

    Report::Document doc(layout, theme);
    EXPECT_FALSE(doc.addSection(QStringLiteral("Bad"), {numberedLines(1), bad}));
    EXPECT_EQ(doc.lastError().code, Report::ErrorCode::InvalidConfigurationError);
    EXPECT_EQ(doc.lastError().sectionIndex, 0);
    EXPECT_EQ(doc.lastError().blockIndex, 1);
    EXPECT_TRUE(doc.sections().isEmpty());
}
