/**
 * @file phrase_catalogue.h
 * @brief Ordered, read-only collection of phrase categories
 *
 * Loaded once at startup, either the built-in catalogue or a JSON file:
 *
 *   {"categories": [
 *       {"name": "Поддержка", "phrases": ["Ты справишься!", "..."]},
 *       ...
 *   ]}
 *
 * Category order is the rotation order. A catalogue that fails validation
 * is a configuration error and the program must not start.
 */

#ifndef PHRASE_CATALOGUE_H
#define PHRASE_CATALOGUE_H

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Named, ordered group of phrases
 */
struct Category {
    std::string name;
    std::vector<std::string> phrases;
};

class PhraseCatalogue {
public:
    /**
     * @brief Empty catalogue; only useful as an out-parameter for build()/load*()
     */
    PhraseCatalogue() = default;

    /**
     * @brief Validate categories and build a catalogue from them
     *
     * Rejects: no categories, a blank or duplicate category name, a category
     * without phrases, a blank phrase.
     *
     * @param categories Categories in rotation order
     * @param out Receives the catalogue on success, untouched on failure
     * @param error Receives a description on failure (may be nullptr)
     * @return true on success
     */
    static bool build(std::vector<Category> categories, PhraseCatalogue* out, std::string* error);

    /**
     * @brief Parse a JSON catalogue document and build() it
     */
    static bool loadFromJson(const std::string& json, PhraseCatalogue* out, std::string* error);

    /**
     * @brief Read a JSON catalogue file and build() it
     */
    static bool loadFromFile(const std::string& path, PhraseCatalogue* out, std::string* error);

    size_t size() const { return _categories.size(); }
    bool empty() const { return _categories.empty(); }
    const Category& at(size_t index) const { return _categories.at(index); }
    const std::vector<Category>& categories() const { return _categories; }

    /**
     * @brief Sum of phrases over all categories
     */
    size_t totalPhraseCount() const;

private:
    explicit PhraseCatalogue(std::vector<Category> categories);

    std::vector<Category> _categories;
};

/**
 * @brief The catalogue compiled into the program
 */
PhraseCatalogue defaultCatalogue();

/**
 * @brief Categories of the built-in catalogue (unvalidated form)
 */
std::vector<Category> defaultCategories();

#endif // PHRASE_CATALOGUE_H
