/*
 * document.h — A report: ordered sections plus page configuration
 *
 * Configuration is validated when the Document is constructed and every
 * block is validated when its section is appended, so render() only
 * fails for layout (BlockTooLargeError) or output (CanvasIOError)
 * reasons.  Rendering does not consume the sections; a Document can be
 * rendered any number of times with identical pagination.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_DOCUMENT_H
#define REPORTFLOW_DOCUMENT_H

#include <QByteArray>
#include <QList>
#include <QString>

#include "layoutengine.h"
#include "pagelayout.h"
#include "reporterror.h"
#include "section.h"
#include "theme.h"

class PageCanvas;
struct ReportSettings;

namespace Report {

struct DocumentInfo {
    QString title;
    QString author;
    QString subject;
};

class Document
{
public:
    explicit Document(const PageLayout &pageLayout = PageLayout(),
                      const Theme &theme = Theme::defaultTheme());
    explicit Document(const ReportSettings &settings);

    bool isValid() const { return !m_configError.isError(); }
    Error configurationError() const { return m_configError; }

    void setInfo(const DocumentInfo &info) { m_info = info; }
    DocumentInfo info() const { return m_info; }

    // Appends a section after validating its blocks.  Refused (false)
    // once the document has been rendered.
    bool addSection(const Section &section);
    bool addSection(const QString &title, const QList<ContentBlock> &blocks);

    const QList<Section> &sections() const { return m_sections; }
    const PageLayout &pageLayout() const { return m_pageLayout; }
    const Theme &theme() const { return m_theme; }

    bool render(PageCanvas *canvas);
    bool renderToFile(const QString &filePath);
    bool renderToData(QByteArray *data);

    bool hasRendered() const { return m_rendered; }
    Error lastError() const { return m_lastError; }
    int pageCount() const { return m_lastLayout.pageCount; }
    const Layout::LayoutResult &lastLayout() const { return m_lastLayout; }

private:
    bool needsPageCount() const;
    bool setLastError(const Error &error);

    PageLayout m_pageLayout;
    Theme m_theme;
    DocumentInfo m_info;
    QList<Section> m_sections;

    Error m_configError;
    Error m_lastError;
    Layout::LayoutResult m_lastLayout;
    bool m_rendered = false;
};

} // namespace Report

#endif // REPORTFLOW_DOCUMENT_H
