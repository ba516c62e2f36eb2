/**
 * @file default_catalogue.cpp
 * @brief Built-in phrase catalogue
 *
 * Used when no catalogue file is configured. Replace or extend through a
 * JSON catalogue file rather than editing this list.
 */

#include "phrase_catalogue.h"
#include "../debug/log_system.h"

static const char* TAG = "CATALOGUE";

std::vector<Category> defaultCategories() {
    return {
        {"Поддержка",   {"Ты справишься!", "Дыши глубже, все ок"}},
        {"Вдохновение", {"Ты как лучик света", "Сегодня твой день"}},
        {"Юмор",        {"Кофе уже в пути"}},
        {"Напоминания", {"Вода? Пора глоток", "Спинка прямая"}},
        {"Отдых",       {"Микро-перерыв?"}},
        {"Цели",        {"Шаг за шагом"}},
        {"Похвала",     {"Я горжусь тобой"}},
        {"Дружба",      {"Я рядом, Марго"}},
        {"Энергия",     {"Зажигаем день!"}},
    };
}

PhraseCatalogue defaultCatalogue() {
    PhraseCatalogue catalogue;
    std::string error;
    if (!PhraseCatalogue::build(defaultCategories(), &catalogue, &error)) {
        MK_LOGE(TAG, "Built-in catalogue rejected: %s", error.c_str());
    }
    return catalogue;
}
