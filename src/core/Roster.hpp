//
// Created by Malik T on 01/10/2025.
//

#ifndef LUDOPLUS_ROSTER_HPP
#define LUDOPLUS_ROSTER_HPP

#include <vector>

#include "Types.hpp"

namespace ludo::core
{
    // A subtype is in exactly one of: available, deployed (via a piece id in on_field), lost.
    struct SupportRoster
    {
        PlyrIdxT owner{};
        std::vector<SupportType> available;
        std::vector<PieceId> on_field;
        std::vector<SupportType> lost;

        auto operator==(SupportRoster const&) const -> bool = default;
    };

    auto MakeRoster(PlyrIdxT owner) -> SupportRoster;

    auto IsAvailable(SupportRoster const& r, SupportType t) noexcept -> bool;
    auto HasFieldRoom(SupportRoster const& r) noexcept -> bool;

    auto Deploy(SupportRoster r, SupportType t, PieceId id) -> SupportRoster;
    // recycle=false sends the subtype to the lost set for good.
    auto Recall(SupportRoster r, SupportType t, PieceId id, bool recycle) -> SupportRoster;
}

#endif //LUDOPLUS_ROSTER_HPP
