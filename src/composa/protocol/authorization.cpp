#include "composa/protocol/authorization.hpp"
#include "composa/protocol/composer.hpp"

namespace composa
{

bool AllowAllPolicy::authorize(const Composer&, const OperationRequest&) const
{
    return true;
}

bool RootOwnerPolicy::authorize(const Composer& composer, const OperationRequest& request) const
{
    if (request.operation == CompositionOperation::Link)
    {
        if (request.kind != ResourceKind::NonFungible)
        {
            return true;
        }
        auto holder = composer.holder_of(request.subject);
        return holder.has_value() && *holder == request.actor;
    }
    auto owner = composer.owner_of(request.subject);
    return owner.has_value() && *owner == request.actor;
}

} // namespace composa
