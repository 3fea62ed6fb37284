/*
 * layoutengine.cpp — Flows report sections onto pages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutengine.h"
#include "document.h"
#include "headerfooterrenderer.h"
#include "pagecanvas.h"
#include "reportsettings.h"
#include "section.h"

#include <QDebug>
#include <QScopeGuard>

#include <variant>

namespace Layout {

QList<BlockPlacement> LayoutResult::placementsOnPage(int page) const
{
    QList<BlockPlacement> result;
    for (const BlockPlacement &p : placements) {
        if (p.page == page)
            result.append(p);
    }
    return result;
}

Engine::Engine(const PageLayout &pageLayout, const Report::Theme &theme)
    : m_pageLayout(pageLayout)
    , m_theme(theme)
    , m_cursor(pageLayout.pageHeight(), pageLayout.margins.top(),
               pageLayout.margins.bottom(), pageLayout.lineHeight)
{
    ReportSettings settings;
    settings.pageLayout = pageLayout;
    settings.theme = theme;
    m_configError = settings.validate();
    if (m_configError.isError())
        qWarning() << "Layout::Engine:" << m_configError.toString();
}

// --- Render ---

LayoutResult Engine::render(const Report::Document &document, PageCanvas *canvas)
{
    m_result = LayoutResult();
    if (!isValid()) {
        m_result.error = m_configError;
        return m_result;
    }
    if (!canvas) {
        m_result.error = Report::Error::make(Report::ErrorCode::CanvasIOError,
                                             QStringLiteral("no canvas to render to"));
        return m_result;
    }

    m_canvas = canvas;
    m_documentTitle = document.info().title;
    m_sectionTitle.clear();
    m_pageIndex = 0;
    m_activeStyle = m_theme.style(Report::Roles::Body);

    canvas->setPageSize(m_pageLayout.pageSize);
    if (!canvas->open()) {
        m_result.error = Report::Error::make(Report::ErrorCode::CanvasIOError,
                                             canvas->errorString());
        m_canvas = nullptr;
        return m_result;
    }

    bool closed = false;
    auto releaseCanvas = qScopeGuard([&] {
        if (!closed)
            canvas->close(true);
        m_canvas = nullptr;
    });

    if (!openPage())
        return m_result;

    const QList<Report::Section> &sections = document.sections();
    for (int si = 0; si < sections.size(); ++si) {
        if (!placeSection(si, sections[si]))
            return m_result;
    }

    if (!finalizePage())
        return m_result;

    closed = true;
    if (!canvas->close()) {
        fail(Report::Error::make(Report::ErrorCode::CanvasIOError, canvas->errorString()));
        return m_result;
    }

    m_result.pageCount = m_pageIndex + 1;
    qDebug() << "Layout: placed" << sections.size() << "sections on"
             << m_result.pageCount << "pages";
    return m_result;
}

// --- Sections ---

bool Engine::placeSection(int sectionIndex, const Report::Section &section)
{
    if (section.pageBreakBefore && !m_cursor.isAtTop()) {
        if (!breakPage(false))
            return false;
    }

    if (!placeTitle(sectionIndex, section))
        return false;

    for (int bi = 0; bi < section.blocks.size(); ++bi) {
        if (!placeBlock(sectionIndex, bi, section.blocks[bi]))
            return false;
    }
    return true;
}

bool Engine::placeTitle(int sectionIndex, const Report::Section &section)
{
    if (section.title.isEmpty()) {
        m_sectionTitle.clear();
        return true;
    }

    const qreal titleHeight = m_pageLayout.titleHeight;
    bool needsBreak = !m_cursor.canFit(titleHeight);

    // Keep-with-next: don't strand the title at the bottom of a page
    if (!needsBreak && !section.blocks.isEmpty()) {
        const qreal together = titleHeight + keepWithNextHeight(section.blocks.first());
        if (!m_cursor.canFit(together)
            && together <= m_cursor.usableHeight() + Cursor::kEpsilon)
            needsBreak = true;
    }

    if (needsBreak && !m_cursor.isAtTop()) {
        if (!breakPage(false))
            return false;
    }
    // Pages finalized above still belong to the previous section
    m_sectionTitle = section.title;

    Placement p = m_cursor.advance(titleHeight);
    if (!p.fits)
        return failTooLarge(sectionIndex, -1, titleHeight);

    applyStyle(m_theme.style(Report::Roles::SectionTitle));
    m_canvas->drawText(m_pageLayout.margins.left(),
                       p.drawY - titleHeight + 0.25 * titleHeight, section.title);
    recordPlacement(sectionIndex, -1, -1, p.drawY, titleHeight);
    return true;
}

// --- Blocks ---

bool Engine::placeBlock(int sectionIndex, int blockIndex, const Report::ContentBlock &block)
{
    if (const auto *table = std::get_if<Report::TableBlock>(&block))
        return placeTable(sectionIndex, blockIndex, *table);

    const qreal height = Report::blockHeight(block);
    if (height > m_cursor.usableHeight() + Cursor::kEpsilon)
        return failTooLarge(sectionIndex, blockIndex, height);

    Placement p = m_cursor.advance(height);
    if (!p.fits) {
        if (m_cursor.isAtTop())
            return failTooLarge(sectionIndex, blockIndex, height);
        qDebug() << "Layout: section" << sectionIndex << "block" << blockIndex
                 << "(" << height << "pt) moves to page" << m_pageIndex + 2;
        if (!breakPage(true))
            return false;
        p = m_cursor.advance(height);
        if (!p.fits)
            return failTooLarge(sectionIndex, blockIndex, height);
    }

    drawBlock(block, p.drawY);
    if (m_canvas->hasError())
        return fail(Report::Error::make(Report::ErrorCode::CanvasIOError,
                                        m_canvas->errorString(), sectionIndex, blockIndex));
    recordPlacement(sectionIndex, blockIndex, -1, p.drawY, height);
    return true;
}

bool Engine::placeTable(int sectionIndex, int blockIndex, const Report::TableBlock &table)
{
    const qreal rowHeight = table.rowHeight;
    const qreal headerHeight = table.hasHeader() ? rowHeight : 0;
    const qreal firstUnit = headerHeight + (table.rows.isEmpty() ? 0 : rowHeight);

    // The header never stands alone, so header + one row must fit a page
    if (firstUnit > m_cursor.usableHeight() + Cursor::kEpsilon)
        return failTooLarge(sectionIndex, blockIndex, firstUnit);

    if (!m_cursor.canFit(firstUnit)) {
        if (!breakPage(true))
            return false;
    }

    auto placeHeader = [&]() {
        if (!table.hasHeader())
            return;
        Placement p = m_cursor.advance(headerHeight);
        drawTableRow(table, table.header, true, p.drawY);
    };

    const qreal tableTop = m_cursor.y();
    placeHeader();
    if (table.rows.isEmpty()) {
        recordPlacement(sectionIndex, blockIndex, -1, tableTop, headerHeight);
        return true;
    }
    for (int r = 0; r < table.rows.size(); ++r) {
        if (!m_cursor.canFit(rowHeight)) {
            qDebug() << "Layout: table in section" << sectionIndex << "block" << blockIndex
                     << "continues at row" << r << "on page" << m_pageIndex + 2;
            if (!breakPage(true))
                return false;
            placeHeader();
        }
        Placement p = m_cursor.advance(rowHeight);
        if (!p.fits)
            return failTooLarge(sectionIndex, blockIndex, headerHeight + rowHeight);
        drawTableRow(table, table.rows[r], false, p.drawY);
        recordPlacement(sectionIndex, blockIndex, r, p.drawY, rowHeight);
    }
    return true;
}

// --- Drawing ---

void Engine::drawBlock(const Report::ContentBlock &block, qreal drawY)
{
    std::visit([&](const auto &b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Report::TextLines>) {
            drawTextLines(b, drawY);
        } else if constexpr (std::is_same_v<T, Report::ImageBlock>) {
            QRectF rect(blockX(b.x), drawY - b.height, b.width, b.height);
            m_canvas->drawImage(rect, b);
        }
        // Tables are placed row by row; spacers draw nothing
    }, block);
}

void Engine::drawTextLines(const Report::TextLines &text, qreal drawY)
{
    applyStyle(text.style);

    const qreal left = blockX(text.x);
    const qreal right = m_pageLayout.pageWidth() - m_pageLayout.margins.right();
    for (int i = 0; i < text.lines.size(); ++i) {
        const QString &line = text.lines[i];
        const qreal baseline = drawY - (i + 1) * text.lineHeight + 0.25 * text.lineHeight;
        qreal x = left;
        if (text.alignment & Qt::AlignHCenter)
            x = left + (right - left - m_canvas->textWidth(line)) / 2.0;
        else if (text.alignment & Qt::AlignRight)
            x = right - m_canvas->textWidth(line);
        m_canvas->drawText(x, baseline, line);
    }
}

void Engine::drawTableRow(const Report::TableBlock &table, const QStringList &cells,
                          bool header, qreal drawY)
{
    const Report::Style style = m_theme.style(header ? Report::Roles::TableHeader
                                                     : Report::Roles::TableCell);
    const QColor background = header ? table.headerBackground : table.bodyBackground;
    const qreal rowHeight = table.rowHeight;
    // Center the cap height of the cell text in the row
    const qreal baseline = drawY - (rowHeight + 0.7 * style.fontSize()) / 2.0;

    qreal x = blockX(table.x);
    for (int c = 0; c < table.columnWidths.size(); ++c) {
        const qreal width = table.columnWidths[c];
        m_canvas->drawRect(QRectF(x, drawY - rowHeight, width, rowHeight),
                           background, table.gridColor, table.gridWidth);
        if (c < cells.size() && !cells[c].isEmpty()) {
            applyStyle(style);
            m_canvas->drawText(x + Report::TableBlock::kCellPadding, baseline, cells[c]);
        }
        x += width;
    }
}

void Engine::applyStyle(const Report::Style &style)
{
    m_activeStyle = style;
    m_canvas->setStyle(style);
}

// --- Pages ---

bool Engine::openPage()
{
    if (!m_canvas->beginPage())
        return fail(Report::Error::make(Report::ErrorCode::CanvasIOError,
                                        m_canvas->errorString()));
    m_cursor.reset();
    m_canvas->setStyle(m_activeStyle);
    return true;
}

bool Engine::finalizePage()
{
    PageMetadata meta;
    meta.pageNumber = m_pageIndex;
    meta.totalPages = m_totalPages;
    meta.title = m_documentTitle;
    meta.section = m_sectionTitle;
    meta.date = m_date;
    HeaderFooterRenderer::drawFooter(m_canvas, m_pageLayout, m_theme, meta);

    if (!m_canvas->endPage() || m_canvas->hasError())
        return fail(Report::Error::make(Report::ErrorCode::CanvasIOError,
                                        m_canvas->errorString()));
    return true;
}

bool Engine::breakPage(bool continuation)
{
    if (!finalizePage())
        return false;
    ++m_pageIndex;
    if (!openPage())
        return false;

    if (continuation) {
        PageMetadata meta;
        meta.pageNumber = m_pageIndex;
        meta.totalPages = m_totalPages;
        meta.title = m_documentTitle;
        meta.section = m_sectionTitle;
        meta.date = m_date;
        HeaderFooterRenderer::drawContinuationHeader(m_canvas, m_pageLayout, meta);
    }
    return true;
}

// --- Helpers ---

void Engine::recordPlacement(int sectionIndex, int blockIndex, int row,
                             qreal y, qreal height)
{
    BlockPlacement p;
    p.section = sectionIndex;
    p.block = blockIndex;
    p.row = row;
    p.page = m_pageIndex;
    p.y = y;
    p.height = height;
    m_result.placements.append(p);
}

bool Engine::fail(const Report::Error &error)
{
    qWarning() << "Layout::Engine:" << error.toString();
    m_result.error = error;
    m_result.pageCount = m_pageIndex + 1;
    return false;
}

bool Engine::failTooLarge(int sectionIndex, int blockIndex, qreal height)
{
    return fail(Report::Error::make(
        Report::ErrorCode::BlockTooLargeError,
        QStringLiteral("%1 pt does not fit the usable page height of %2 pt")
            .arg(height).arg(m_cursor.usableHeight()),
        sectionIndex, blockIndex));
}

qreal Engine::blockX(const std::optional<qreal> &x) const
{
    return x.value_or(m_pageLayout.margins.left());
}

// Height that must fit below a section title for the title to stay put
qreal Engine::keepWithNextHeight(const Report::ContentBlock &block) const
{
    return std::visit([](const auto &b) -> qreal {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Report::TextLines>)
            return qMin<qsizetype>(2, b.lines.size()) * b.lineHeight;
        else if constexpr (std::is_same_v<T, Report::TableBlock>)
            return (b.hasHeader() ? b.rowHeight : 0) + (b.rows.isEmpty() ? 0 : b.rowHeight);
        else if constexpr (std::is_same_v<T, Report::ImageBlock>)
            return b.height;
        else
            return 0;
    }, block);
}

} // namespace Layout
