#include "messages.hpp"

const std::string FALLBACK_LOCALE = "en";

namespace {

using MessageTable = std::map<Msg, std::string>;

const MessageTable& english() {
    static const MessageTable table = {
        {Msg::ErrorPrefix, "Error:"},
        {Msg::NoChanges, "No changes. Use --staged for index or change files. For last commit: smart-diff --ref HEAD"},
        {Msg::AnalyzingLast, "No local changes — analyzing last commit (HEAD)."},
        {Msg::ModelLabel, "Model: {model}. Analyzing changes..."},
        {Msg::CommitMsgGenerating, "Model: {model}. Generating commit message..."},
        {Msg::CommitWritten, "Message written to {path}"},
        {Msg::SuggestedCommit, "Suggested commit message"},
        {Msg::AnalysisTitle, "Smart Diff — change analysis"},
        {Msg::OllamaConnect, "Could not connect to Ollama. Start Ollama (https://ollama.com/download) and try again."},
        {Msg::OllamaModelNotFound, "Model '{model}' not found in Ollama. Install: ollama pull {model}\nOr set an installed model: smart-diff -m <name>. List: ollama list"},
        {Msg::OllamaHint, "Hint: ollama list — list models, ollama pull {model} — install."},
        {Msg::ConfigModelSet, "Default model set to: {model}"},
        {Msg::ConfigLangSet, "Default language set to: {lang}"},
        {Msg::ConfigThemeSet, "Report theme set to: {theme}"},
        {Msg::ConfigAutoOpenSet, "Report auto-open set to: {value}"},
        {Msg::ConfigShow, "model = {model}\nlang = {lang}"},
        {Msg::ConfigPath, "Config file: {path}"},
        {Msg::HtmlReportWrittenPrefix, "HTML report written to "},
        {Msg::ProgressAnalyzing, "Analyzing changes..."},
        {Msg::ProgressCommitMsg, "Generating commit message..."},
    };
    return table;
}

const MessageTable& russian() {
    static const MessageTable table = {
        {Msg::ErrorPrefix, "Ошибка:"},
        {Msg::NoChanges, "Нет изменений. Используй --staged для индекса или измени файлы. Для последнего коммита: smart-diff --ref HEAD"},
        {Msg::AnalyzingLast, "Нет текущих изменений — анализирую последний коммит (HEAD)."},
        {Msg::ModelLabel, "Модель: {model}. Анализ изменений..."},
        {Msg::CommitMsgGenerating, "Модель: {model}. Генерация сообщения коммита..."},
        {Msg::CommitWritten, "Сообщение записано в {path}"},
        {Msg::SuggestedCommit, "Предложенное сообщение коммита"},
        {Msg::AnalysisTitle, "Smart Diff — разбор изменений"},
        {Msg::OllamaConnect, "Не удалось подключиться к Ollama. Запусти Ollama (https://ollama.com/download) и повтори команду."},
        {Msg::OllamaModelNotFound, "Модель '{model}' не найдена в Ollama. Установи: ollama pull {model}\nЛибо укажи модель: smart-diff -m <имя>. Список: ollama list"},
        {Msg::OllamaHint, "Подсказка: ollama list — список моделей, ollama pull {model} — установка."},
        {Msg::ConfigModelSet, "Модель по умолчанию: {model}"},
        {Msg::ConfigLangSet, "Язык по умолчанию: {lang}"},
        {Msg::ConfigShow, "model = {model}\nlang = {lang}"},
        {Msg::ConfigPath, "Файл конфига: {path}"},
        {Msg::HtmlReportWrittenPrefix, "HTML-отчёт записан в "},
        {Msg::ProgressAnalyzing, "Анализ изменений..."},
        {Msg::ProgressCommitMsg, "Генерация сообщения коммита..."},
    };
    return table;
}

const MessageTable& table_for(const std::string& locale) {
    if (locale == "ru") return russian();
    return english();
}

std::string substitute(std::string text, const std::map<std::string, std::string>& args) {
    for (const auto& [name, value] : args) {
        const std::string placeholder = "{" + name + "}";
        std::size_t pos = 0;
        while ((pos = text.find(placeholder, pos)) != std::string::npos) {
            text.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
    }
    return text;
}

}

std::string translate(Msg key, const std::string& locale, const std::map<std::string, std::string>& args) {
    const MessageTable& table = table_for(locale);
    auto it = table.find(key);
    if (it == table.end()) {
        const MessageTable& fallback = table_for(FALLBACK_LOCALE);
        it = fallback.find(key);
        if (it == fallback.end()) return "";
    }
    return substitute(it->second, args);
}

std::string ui_locale(const std::string& lang) {
    if (lang == "ru") return "ru";
    return FALLBACK_LOCALE;
}
