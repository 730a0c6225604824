#include "classifier.hpp"

namespace {

constexpr size_t kMinTitleLength = 5;

} // namespace

bool listing_fits_search(const ListingResult& listing, const SearchSpec& spec) {
    if (listing.title.size() < kMinTitleLength) return false;
    if (spec.title_excluded(listing.title)) return false;
    if (!spec.include_auctions && listing.auction_only()) return false;
    return true;
}

SightingKind classify_sighting(const std::optional<double>& previous_price,
                               const ListingResult& listing,
                               const SearchSpec& spec) {
    const bool in_band = spec.price_in_band(listing.price, listing.best_offer());

    if (previous_price) {
        // Exclusions hold for drops too, but the required-word check only
        // gates first sightings
        if (*previous_price > listing.price && in_band && !spec.title_excluded(listing.title)) {
            return SightingKind::PriceDrop;
        }
        return SightingKind::Repeat;
    }

    if (!listing_fits_search(listing, spec) || !spec.title_matches(listing.title)) {
        return SightingKind::Rejected;
    }
    return in_band ? SightingKind::NewListing : SightingKind::OutOfBand;
}
