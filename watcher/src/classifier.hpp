#pragma once

#include "listing.hpp"
#include "search_spec.hpp"
#include <optional>

enum class SightingKind {
    NewListing,   // first sighting, inside the price band
    PriceDrop,    // seen before at a higher price, now inside the band
    Repeat,       // seen before, nothing to report
    OutOfBand,    // first sighting, price outside the band
    Rejected      // title or buying format does not fit the search
};

// Decides what a listing means for a search given the price recorded on its
// previous sighting (nullopt for a first sighting).
SightingKind classify_sighting(const std::optional<double>& previous_price,
                               const ListingResult& listing,
                               const SearchSpec& spec);

// Title and format checks applied before price logic
bool listing_fits_search(const ListingResult& listing, const SearchSpec& spec);
