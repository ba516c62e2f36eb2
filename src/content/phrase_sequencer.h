/**
 * @file phrase_sequencer.h
 * @brief Cursor over the catalogue that picks the next phrase for a mode
 */

#ifndef PHRASE_SEQUENCER_H
#define PHRASE_SEQUENCER_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include "display_mode.h"
#include "phrase_catalogue.h"

/**
 * @brief One pick: pointers into the (immutable) catalogue
 */
struct PhraseSelection {
    const Category* category = nullptr;
    const std::string* phrase = nullptr;
};

/**
 * @brief Stateful traversal of a validated catalogue
 *
 * The cursor (category_index, phrase_index) always points at an existing
 * phrase. It moves only through nextPhrase() in the ordered modes and
 * through jumpToNextCategory().
 *
 * Not thread safe; owned by the main loop.
 */
class PhraseSequencer {
public:
    /**
     * @param catalogue Validated catalogue; must outlive the sequencer
     * @param seed Seed for RANDOM mode picks
     */
    explicit PhraseSequencer(const PhraseCatalogue& catalogue,
                             uint32_t seed = std::random_device{}());

    /**
     * @brief Pick the next phrase for a mode
     *
     * SEQUENTIAL and CATEGORY_SEQUENCE return the phrase under the cursor
     * and advance it, rolling into the next category (with wraparound) when
     * the current one is exhausted. RANDOM picks a uniform category, then a
     * uniform phrase, and leaves the cursor alone.
     *
     * @param mode Content mode
     * @param out Receives the pick
     * @return false for WEATHER (not a phrase mode) or an empty catalogue
     */
    bool nextPhrase(DisplayMode mode, PhraseSelection* out);

    /**
     * @brief Pin the following category: category_index+1 (wrapping), phrase_index 0
     */
    void jumpToNextCategory();

    size_t categoryIndex() const { return _categoryIndex; }
    size_t phraseIndex() const { return _phraseIndex; }
    const Category& currentCategory() const { return _catalogue.at(_categoryIndex); }
    const PhraseCatalogue& catalogue() const { return _catalogue; }

private:
    PhraseSelection takeAndAdvance();
    PhraseSelection pickRandom();

    const PhraseCatalogue& _catalogue;
    size_t _categoryIndex;
    size_t _phraseIndex;
    std::mt19937 _rng;
};

#endif // PHRASE_SEQUENCER_H
