#include "ownership.hpp"
#include <core/utils.hpp>

static Result<void> with_context(Result<void> r, const char* context) {
    if (r.is_err()) return Result<void>::Err(r.error.wrap(context));
    return r;
}

Result<void> apply_initial_ownership(RemoteClient& client, const std::string& path,
                                     const OwnershipSpec& plan) {
    Result<void> r = Result<void>::Ok();

    if (plan.owner.is_known()) {
        r = client.chown(path, std::to_string(plan.owner.value()));
    } else if (plan.owner_name.is_known()) {
        r = client.chown(path, plan.owner_name.value());
    }
    if (r.is_err()) return with_context(r, "Error updating user ownership");

    if (plan.group.is_known()) {
        r = client.chgrp(path, std::to_string(plan.group.value()));
    } else if (plan.group_name.is_known()) {
        r = client.chgrp(path, plan.group_name.value());
    }
    if (r.is_err()) return with_context(r, "Error updating group ownership");

    if (plan.permissions.is_known()) {
        r = client.chmod(path, plan.permissions.value());
    }
    return with_context(r, "Error updating permissions");
}

Result<void> apply_ownership_changes(RemoteClient& client, const std::string& path,
                                     const OwnershipSpec& plan,
                                     const ObservedAttributes& prior) {
    Result<void> r = Result<void>::Ok();

    if (plan.owner.differs_from(prior.owner)) {
        r = client.chown(path, std::to_string(plan.owner.value()));
    } else if (plan.owner_name.differs_from(prior.owner_name)) {
        r = client.chown(path, plan.owner_name.value());
    }
    if (r.is_err()) return with_context(r, "Error updating user ownership");

    if (plan.group.differs_from(prior.group)) {
        r = client.chgrp(path, std::to_string(plan.group.value()));
    } else if (plan.group_name.differs_from(prior.group_name)) {
        r = client.chgrp(path, plan.group_name.value());
    }
    if (r.is_err()) return with_context(r, "Error updating group ownership");

    if (plan.permissions.differs_from(prior.permissions)) {
        r = client.chmod(path, plan.permissions.value());
    }
    return with_context(r, "Error updating permissions");
}

Result<ObservedAttributes> read_attributes(RemoteClient& client, const std::string& path) {
    using AttrResult = Result<ObservedAttributes>;
    ObservedAttributes attrs;

    auto group = client.read_group(path);
    if (group.is_err()) return AttrResult::Err(group.error.wrap("Couldn't load group id"));
    auto owner = client.read_owner(path);
    if (owner.is_err()) return AttrResult::Err(owner.error.wrap("Couldn't load owner id"));
    auto group_name = client.read_group_name(path);
    if (group_name.is_err()) return AttrResult::Err(group_name.error.wrap("Couldn't load group name"));
    auto owner_name = client.read_owner_name(path);
    if (owner_name.is_err()) return AttrResult::Err(owner_name.error.wrap("Couldn't load owner name"));
    auto permissions = client.read_permissions(path);
    if (permissions.is_err()) return AttrResult::Err(permissions.error.wrap("Couldn't load permissions"));

    attrs.owner = safe_stoll(owner.value);
    attrs.group = safe_stoll(group.value);
    attrs.owner_name = owner_name.value;
    attrs.group_name = group_name.value;
    attrs.permissions = permissions.value;
    return AttrResult::Ok(attrs);
}
