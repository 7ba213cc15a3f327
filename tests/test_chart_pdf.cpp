#include "chart.h"
#include "pdf_document.h"

#include "test_utils.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(Chart, PieLayoutCoversFullCircle) {
    auto wedges = layoutPie({"a", "b", "c"}, {1, 1, 2}, 90.0);
    ASSERT_EQ(wedges.size(), 3u);
    EXPECT_DOUBLE_EQ(wedges[0].startDeg, 90.0);
    EXPECT_DOUBLE_EQ(wedges[2].fraction, 0.5);
    EXPECT_DOUBLE_EQ(wedges[2].endDeg, 450.0);
    EXPECT_TRUE(layoutPie({"x"}, {0}).empty());
}

TEST(Chart, TextRendererPrintsLabelsAndValues) {
    std::ostringstream out;
    TextChartRenderer text(out, 10);
    text.barChart("Top", {"Rent", "Food"}, {100, 50});
    std::string s = out.str();
    EXPECT_NE(s.find("Rent | ########## 100.00"), std::string::npos);
    EXPECT_NE(s.find("Food | ##### 50.00"), std::string::npos);
}

TEST(Chart, SvgStacksPanels) {
    TempDir tmp;
    SvgChartRenderer svg;
    svg.barChart("Top & more", {"<Rent>"}, {10});
    svg.groupedBarChart("Months", {"2024-01", "2024-02"}, {{"Income", {5, 6}}, {"Expenditure", {3, 9}}});
    svg.pieChart("Share", {"a", "b"}, {1, 3});
    EXPECT_EQ(svg.panelCount(), 3);
    std::string doc = svg.document();
    EXPECT_NE(doc.find("height=\"" + std::to_string(3 * SvgChartRenderer::kPanelHeight) + "\""), std::string::npos);
    EXPECT_NE(doc.find("Top &amp; more"), std::string::npos);
    EXPECT_NE(doc.find("&lt;Rent&gt;"), std::string::npos);
    auto path = tmp.path() / "charts.svg";
    ASSERT_TRUE(svg.save(path));
    EXPECT_EQ(readFile(path), doc);
}

TEST(Pdf, WinAnsiMapping) {
    EXPECT_EQ(toWinAnsi("plain"), "plain");
    EXPECT_EQ(toWinAnsi("₹10"), "Rs.10");
    EXPECT_EQ(toWinAnsi("€"), "\x80");
    EXPECT_EQ(toWinAnsi("a\xE2\x80\x94" "b"), "a\x97" "b");
    EXPECT_EQ(toWinAnsi("£"), "\xA3");
}

TEST(Pdf, RendersXrefForSixObjects) {
    PdfDocument doc;
    doc.setFont(true, 14);
    doc.drawText(40, 800, "Hello (world)");
    doc.fillWedge(100, 100, 50, 0, 120);
    std::string pdf = doc.render();
    EXPECT_EQ(pdf.compare(0, 8, "%PDF-1.4"), 0);
    EXPECT_NE(pdf.find("xref\n0 7\n"), std::string::npos);
    EXPECT_NE(pdf.find("Hello \\(world\\)"), std::string::npos);
    EXPECT_NE(pdf.find("/BaseFont /Helvetica-Bold"), std::string::npos);
}
