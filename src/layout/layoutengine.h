/*
 * layoutengine.h — Flows report sections onto pages
 *
 * Blocks are placed top-down with a Cursor.  A block that does not fit
 * triggers a page break: the page is finalized (footer, endPage), a new
 * page is begun, the active text style is re-applied and the
 * continuation header drawn, then the block is offered once more.
 * Tables are placed row by row and repeat their header row after each
 * break.  Nothing is ever split inside a text, image or spacer block.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_LAYOUTENGINE_H
#define REPORTFLOW_LAYOUTENGINE_H

#include <QDate>
#include <QList>
#include <QString>

#include <optional>

#include "contentblock.h"
#include "cursor.h"
#include "pagelayout.h"
#include "reporterror.h"
#include "style.h"
#include "theme.h"

class PageCanvas;

namespace Report {
class Document;
struct Section;
}

namespace Layout {

// Where a title, block or table row ended up.
struct BlockPlacement {
    int section = -1;
    int block = -1;     // -1 = the section title
    int row = -1;       // table data row, -1 for everything else
    int page = 0;       // 0-based
    qreal y = 0;        // top edge in page coordinates
    qreal height = 0;
};

struct LayoutResult {
    int pageCount = 0;
    QList<BlockPlacement> placements;
    Report::Error error;

    bool ok() const { return !error.isError(); }
    QList<BlockPlacement> placementsOnPage(int page) const;
};

class Engine {
public:
    Engine(const PageLayout &pageLayout, const Report::Theme &theme);

    // Configuration problems are detected here, before any drawing.
    bool isValid() const { return !m_configError.isError(); }
    Report::Error error() const { return m_configError; }

    // Value substituted for {pages}; 0 leaves it unresolved.
    void setTotalPages(int pages) { m_totalPages = pages; }
    void setDate(const QDate &date) { m_date = date; }

    // Opens the canvas, places every section and closes it again.  The
    // canvas is closed as aborted if anything fails.
    LayoutResult render(const Report::Document &document, PageCanvas *canvas);

private:
    bool placeSection(int sectionIndex, const Report::Section &section);
    bool placeTitle(int sectionIndex, const Report::Section &section);
    bool placeBlock(int sectionIndex, int blockIndex, const Report::ContentBlock &block);
    bool placeTable(int sectionIndex, int blockIndex, const Report::TableBlock &table);

    void drawBlock(const Report::ContentBlock &block, qreal drawY);
    void drawTextLines(const Report::TextLines &text, qreal drawY);
    void drawTableRow(const Report::TableBlock &table, const QStringList &cells,
                      bool header, qreal drawY);

    bool openPage();
    bool finalizePage();
    bool breakPage(bool continuation);

    void applyStyle(const Report::Style &style);
    void recordPlacement(int sectionIndex, int blockIndex, int row,
                         qreal y, qreal height);
    bool fail(const Report::Error &error);
    bool failTooLarge(int sectionIndex, int blockIndex, qreal height);

    qreal blockX(const std::optional<qreal> &x) const;
    qreal keepWithNextHeight(const Report::ContentBlock &block) const;

    PageLayout m_pageLayout;
    Report::Theme m_theme;
    Report::Error m_configError;
    int m_totalPages = 0;
    QDate m_date = QDate::currentDate();

    // Per render
    PageCanvas *m_canvas = nullptr;
    Cursor m_cursor;
    Report::Style m_activeStyle;
    QString m_documentTitle;
    QString m_sectionTitle;
    int m_pageIndex = 0;
    LayoutResult m_result;
};

} // namespace Layout

#endif // REPORTFLOW_LAYOUTENGINE_H
