//
// Created by Malik T on 01/10/2025.
//

#include "Roster.hpp"

#include <algorithm>
#include <utility>

#include "Exception.hpp"

namespace ludo::core
{
    auto MakeRoster(PlyrIdxT owner) -> SupportRoster
    {
        SupportRoster r{};
        r.owner = owner;
        r.available.assign(AllSupportTypes.begin(), AllSupportTypes.end());
        return r;
    }

    auto IsAvailable(SupportRoster const& r, SupportType t) noexcept -> bool
    {
        return std::ranges::find(r.available, t) != r.available.end();
    }

    auto HasFieldRoom(SupportRoster const& r) noexcept -> bool
    {
        return r.on_field.size() < constants::MaxSupportsOnField;
    }

    auto Deploy(SupportRoster r, SupportType t, PieceId id) -> SupportRoster
    {
        auto const it = std::ranges::find(r.available, t);
        LUDO_ASSERT(it != r.available.end(), "Deploying a subtype that is not available");
        LUDO_ASSERT(HasFieldRoom(r), "Deploying past the on-field cap");

        r.available.erase(it);
        r.on_field.push_back(id);
        return r;
    }

    auto Recall(SupportRoster r, SupportType t, PieceId id, bool recycle) -> SupportRoster
    {
        auto const it = std::ranges::find(r.on_field, id);
        LUDO_ASSERT(it != r.on_field.end(), "Recalling a piece that is not deployed");
        r.on_field.erase(it);

        if (!recycle)
        {
            r.lost.push_back(t);
            return r;
        }
        r.available.push_back(t);
        // keep the canonical Escort, Blocker, Assassin, Pusher order
        std::ranges::sort(r.available);
        return r;
    }
}
