#pragma once
#include <vector>
#include "core/types.hpp"

namespace ind {

enum class ExtremumKind { Peak, Valley };

struct Extremum {
    std::size_t index{0};
    double price{0.0};
    ExtremumKind kind{ExtremumKind::Peak};
    double prominence{0.0};
};

struct Extrema {
    std::vector<Extremum> peaks;
    std::vector<Extremum> valleys;
};

struct ExtremaParams {
    double prominence{0.02};     // fraction of the column range (max - min)
    std::size_t distance{5};     // bars on each side the extremum must dominate
    std::size_t min_length{10};
};

// Local peaks and valleys of `v`, both ordered by index.
//
// A peak at i is strictly above every value in [i-distance, i) and not below
// any value in (i, i+distance], so a plateau resolves to its first bar. Its
// prominence is the height above the higher of the two lowest points reached
// when walking outwards until a strictly higher value. Only extrema with
// prominence > params.prominence * range survive. Valleys mirror this.
//
// Too-short or flat input yields an empty result, never an error.
Extrema find_extrema(const std::vector<double>& v, const ExtremaParams& params = {});

// Same over one column of a series, starting at bar `from`; indices are
// relative to `from`.
Extrema find_extrema(const core::Series& s, core::Column c,
                     const ExtremaParams& params = {}, std::size_t from = 0);

} // namespace ind
