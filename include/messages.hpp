#pragma once

#include <map>
#include <string>

enum class Msg {
    ErrorPrefix,
    NoChanges,
    AnalyzingLast,
    ModelLabel,
    CommitMsgGenerating,
    CommitWritten,
    SuggestedCommit,
    AnalysisTitle,
    OllamaConnect,
    OllamaModelNotFound,
    OllamaHint,
    ConfigModelSet,
    ConfigLangSet,
    ConfigThemeSet,
    ConfigAutoOpenSet,
    ConfigShow,
    ConfigPath,
    HtmlReportWrittenPrefix,
    ProgressAnalyzing,
    ProgressCommitMsg
};

extern const std::string FALLBACK_LOCALE;

// Template for key in locale, falling back to FALLBACK_LOCALE. Every
// "{name}" placeholder with an entry in args is substituted.
std::string translate(Msg key, const std::string& locale, const std::map<std::string, std::string>& args = {});

// Locale used for interface text: "auto" and unknown languages show English.
std::string ui_locale(const std::string& lang);
