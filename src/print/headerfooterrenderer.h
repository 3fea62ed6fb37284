#ifndef REPORTFLOW_HEADERFOOTERRENDERER_H
#define REPORTFLOW_HEADERFOOTERRENDERER_H

#include <QDate>
#include <QString>

class PageCanvas;
struct PageLayout;

namespace Report {
class Theme;
}

struct PageMetadata {
    int pageNumber = 0;   // 0-based
    int totalPages = 0;   // 0 = not known (no counting pass was run)
    QString title;        // document title
    QString section;      // title of the section being placed
    QDate date = QDate::currentDate();
};

namespace HeaderFooterRenderer {

// Centered footer line at layout.footerOffset above the page bottom,
// drawn in the theme's footer style.  Empty footer text draws nothing.
void drawFooter(PageCanvas *canvas, const PageLayout &layout,
                const Report::Theme &theme, const PageMetadata &meta);

// Continuation line at the left margin, layout.continuationOffset below
// the page top, drawn in whatever style the canvas currently has.
void drawContinuationHeader(PageCanvas *canvas, const PageLayout &layout,
                            const PageMetadata &meta);

// Substitutes {page} {pages} {title} {section} {date} {date:format}.
QString resolveField(const QString &text, const PageMetadata &meta);

// True if text needs the total page count ({pages}).
bool needsTotalPages(const QString &text);

} // namespace HeaderFooterRenderer

#endif // REPORTFLOW_HEADERFOOTERRENDERER_H
