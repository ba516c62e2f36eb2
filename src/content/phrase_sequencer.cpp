/**
 * @file phrase_sequencer.cpp
 * @brief Phrase rotation
 */

#include "phrase_sequencer.h"
#include "../debug/log_system.h"

static const char* TAG = "SEQUENCER";

PhraseSequencer::PhraseSequencer(const PhraseCatalogue& catalogue, uint32_t seed)
    : _catalogue(catalogue), _categoryIndex(0), _phraseIndex(0), _rng(seed) {}

bool PhraseSequencer::nextPhrase(DisplayMode mode, PhraseSelection* out) {
    if (_catalogue.empty() || out == nullptr) {
        return false;
    }

    switch (mode) {
        case DisplayMode::SEQUENTIAL:
        case DisplayMode::CATEGORY_SEQUENCE:
            *out = takeAndAdvance();
            return true;
        case DisplayMode::RANDOM:
            *out = pickRandom();
            return true;
        case DisplayMode::WEATHER:
            break;
    }
    MK_LOGW(TAG, "No phrase for mode %s", getModeKey(mode));
    return false;
}

void PhraseSequencer::jumpToNextCategory() {
    if (_catalogue.empty()) {
        return;
    }
    _categoryIndex = (_categoryIndex + 1) % _catalogue.size();
    _phraseIndex = 0;
    MK_LOGD(TAG, "Pinned category %zu '%s'", _categoryIndex,
            _catalogue.at(_categoryIndex).name.c_str());
}

PhraseSelection PhraseSequencer::takeAndAdvance() {
    const Category& category = _catalogue.at(_categoryIndex);

    PhraseSelection selection;
    selection.category = &category;
    selection.phrase = &category.phrases[_phraseIndex];

    _phraseIndex++;
    if (_phraseIndex >= category.phrases.size()) {
        _phraseIndex = 0;
        _categoryIndex = (_categoryIndex + 1) % _catalogue.size();
    }
    return selection;
}

PhraseSelection PhraseSequencer::pickRandom() {
    std::uniform_int_distribution<size_t> pick_category(0, _catalogue.size() - 1);
    const Category& category = _catalogue.at(pick_category(_rng));

    std::uniform_int_distribution<size_t> pick_phrase(0, category.phrases.size() - 1);

    PhraseSelection selection;
    selection.category = &category;
    selection.phrase = &category.phrases[pick_phrase(_rng)];
    return selection;
}
