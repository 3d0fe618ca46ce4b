#include <cassert>
#include <iostream>

#include "domain/ReferenceFormats.hpp"

using namespace sourcemark::domain;

int main() {
    std::cout << "[Test] Starting ReferenceFormats Test..." << std::endl;

    // Markers
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Superscript)(4) == "<sup>4</sup>");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Bracket)(4) == "[4]");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Parenthesis)(4) == " (4)");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Footnote)(4) == "[^4]");

    // List prefixes
    assert(ReferenceFormats::ListPrefixForStyle(ReferenceStyle::Superscript)(2) == "<sup>2</sup> ");
    assert(ReferenceFormats::ListPrefixForStyle(ReferenceStyle::Bracket)(2) == "[2] ");
    assert(ReferenceFormats::ListPrefixForStyle(ReferenceStyle::Parenthesis)(2) == "(2) ");
    assert(ReferenceFormats::ListPrefixForStyle(ReferenceStyle::Footnote)(2) == "[^2]: ");

    // Markers per output format
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Superscript, ExportFormat::Latex)(4) == "\\textsuperscript{4}");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Footnote, ExportFormat::Latex)(4) == "\\footnotemark[4]");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Bracket, ExportFormat::Latex)(4) == "[4]");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Footnote, ExportFormat::Html)(4) == "<sup><a href=\"#ref-4\">4</a></sup>");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Superscript, ExportFormat::Html)(4) == "<sup>4</sup>");
    assert(ReferenceFormats::ForStyle(ReferenceStyle::Footnote, ExportFormat::Markdown)(4) == "[^4]");

    assert(ReferenceFormats::Identity()("a <b> & c") == "a <b> & c");
    assert(ReferenceFormats::LatexEscape("100% a_b & {c} #1 $2 ~^\\") ==
           "100\\% a\\_b \\& \\{c\\} \\#1 \\$2 \\textasciitilde{}\\textasciicircum{}\\textbackslash{}");
    assert(ReferenceFormats::BodyEscaperFor(ExportFormat::Html)("<i>") == "&lt;i&gt;");
    assert(ReferenceFormats::BodyEscaperFor(ExportFormat::Latex)("50%") == "50\\%");
    assert(ReferenceFormats::BodyEscaperFor(ExportFormat::Markdown)("<i> 50%") == "<i> 50%");
    assert(ReferenceFormats::BodyEscaperFor(ExportFormat::Json)("<i> 50%") == "<i> 50%");
    assert(ReferenceFormats::HtmlEscape("a <b> & \"c\" 'd'") == "a &lt;b&gt; &amp; &quot;c&quot; &#39;d&#39;");
    assert(ReferenceFormats::HtmlEscape("plain text") == "plain text");

    // Names
    for (auto style : {ReferenceStyle::Superscript, ReferenceStyle::Bracket,
                       ReferenceStyle::Parenthesis, ReferenceStyle::Footnote}) {
        auto parsed = ReferenceFormats::ParseStyle(ReferenceFormats::StyleName(style));
        assert(parsed && *parsed == style);
    }
    assert(ReferenceFormats::ParseStyle(" Bracket ") == ReferenceStyle::Bracket);
    assert(!ReferenceFormats::ParseStyle("roman"));

    for (auto format : {ExportFormat::Markdown, ExportFormat::Html, ExportFormat::Latex,
                        ExportFormat::Text, ExportFormat::Json}) {
        auto parsed = ReferenceFormats::ParseExportFormat(ReferenceFormats::ExportFormatName(format));
        assert(parsed && *parsed == format);
    }
    assert(ReferenceFormats::ParseExportFormat("MD") == ExportFormat::Markdown);
    assert(!ReferenceFormats::ParseExportFormat("docx"));

    std::cout << "[PASS] ReferenceFormats Test." << std::endl;
    return 0;
}
