#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lease::domain {

/**
 * @brief Внешний вид виджета чата
 */
struct WidgetCustomization {
    std::string primaryColor = "#0084ff";
    std::string secondaryColor = "#ffffff";
    std::string headerText = "Chat with us";
    std::string botName = "Assistant";
    std::string logoUrl;
};

/**
 * @brief Конфигурация виджета арендатора
 *
 * Ядро её не интерпретирует: хранилище отдаёт, валидатор возвращает
 * авторизованному вызывающему как есть.
 */
struct WidgetConfig {
    std::string widgetId;
    WidgetCustomization customization;
};

inline nlohmann::json toJson(const WidgetConfig& config) {
    nlohmann::json customization;
    customization["primaryColor"] = config.customization.primaryColor;
    customization["secondaryColor"] = config.customization.secondaryColor;
    customization["headerText"] = config.customization.headerText;
    customization["botName"] = config.customization.botName;
    customization["logoUrl"] = config.customization.logoUrl;

    nlohmann::json j;
    j["widgetId"] = config.widgetId;
    j["customization"] = customization;
    return j;
}

/**
 * @brief Разобрать конфигурацию из JSON
 *
 * Отсутствующие поля получают значения по умолчанию.
 * @throws nlohmann::json::exception если поля имеют неверный тип
 */
inline WidgetConfig widgetConfigFromJson(const nlohmann::json& j) {
    WidgetConfig config;
    if (!j.is_object()) {
        return config;
    }
    config.widgetId = j.value("widgetId", "");

    if (j.contains("customization") && j["customization"].is_object()) {
        const auto& c = j["customization"];
        WidgetCustomization defaults;
        config.customization.primaryColor = c.value("primaryColor", defaults.primaryColor);
        config.customization.secondaryColor = c.value("secondaryColor", defaults.secondaryColor);
        config.customization.headerText = c.value("headerText", defaults.headerText);
        config.customization.botName = c.value("botName", defaults.botName);
        config.customization.logoUrl = c.value("logoUrl", defaults.logoUrl);
    }
    return config;
}

} // namespace lease::domain
