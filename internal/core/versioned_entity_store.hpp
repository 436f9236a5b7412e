#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/unit_of_work.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/context.hpp"
#include "internal/model/versioned_record.hpp"
#include "internal/notify/change_notifier.hpp"

namespace infragraph::core {

/*
  Stores and resolves Entity / Node / Edge rows across the three tiers.

  Reads resolve along the context's chain (edit session, change set, head);
  the first row found wins and a tombstone there reads as NotFound.

  Writes land on the context's most specific tier. The first write of an
  object at a tier clones the best visible ancestor (copy-on-write); later
  writes mutate that draft in place.

  Every operation exists twice: a self-contained one that opens and commits
  its own transaction, and one that joins the caller's UnitOfWork.
*/
class VersionedEntityStore {
 public:
  template <typename Body>
  using Mutation = std::function<void(Body&)>;

  VersionedEntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ChangeNotifier> notifier);

  std::unique_ptr<UnitOfWork> BeginWrite() const;
  std::unique_ptr<UnitOfWork> BeginRead() const;

  // Tiers consulted for reads under ctx, most specific first.
  std::vector<model::TierKey> ReadChain(UnitOfWork& uow, const model::Context& ctx) const;

  template <typename Body>
  model::VersionedRecord<Body> Resolve(const std::string& object_id, const model::Context& ctx) const;
  template <typename Body>
  model::VersionedRecord<Body> Resolve(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx) const;

  // Empty object_id creates a new object under a generated id.
  template <typename Body>
  model::VersionedRecord<Body> Write(const std::string& object_id, const model::Context& ctx, const Mutation<Body>& mutate);
  template <typename Body>
  model::VersionedRecord<Body> Write(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx, const Mutation<Body>& mutate);

  template <typename Body>
  void Remove(const std::string& object_id, const model::Context& ctx);
  template <typename Body>
  void Remove(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx);

  // Ordered by object_id; an empty kind_tag lists every kind.
  template <typename Body>
  std::vector<model::VersionedRecord<Body>> List(const model::Context& ctx, const std::string& kind_tag = {}) const;
  template <typename Body>
  std::vector<model::VersionedRecord<Body>> List(UnitOfWork& uow, const model::Context& ctx, const std::string& kind_tag = {}) const;

  // Compares the record visible under ctx with its head row. ctx must name a
  // change set or edit session; a head context is util::InvalidArgument.
  template <typename Body>
  v1::RecordDiff Diff(const std::string& object_id, const model::Context& ctx) const;
  template <typename Body>
  v1::RecordDiff Diff(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx) const;

  // Entity-typed shorthands.
  model::Entity ResolveEntity(const std::string& object_id, const model::Context& ctx) const {
    return Resolve<v1::EntityBody>(object_id, ctx);
  }
  model::Entity WriteEntity(const std::string& object_id, const model::Context& ctx, const Mutation<v1::EntityBody>& mutate) {
    return Write<v1::EntityBody>(object_id, ctx, mutate);
  }
  std::vector<model::Entity> ListEntities(const model::Context& ctx, const std::string& entity_type = {}) const {
    return List<v1::EntityBody>(ctx, entity_type);
  }

 private:
  struct WriteTarget {
    model::TierKey              tier;
    std::vector<model::TierKey> ancestors;
    std::string                 workspace_id;
  };

  WriteTarget ResolveWriteTarget(UnitOfWork& uow, const model::Context& ctx) const;

  template <typename Body>
  std::optional<model::VersionedRecord<Body>> FindVisible(UnitOfWork& uow, const std::string& object_id,
                                                          const std::vector<model::TierKey>& chain) const;

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<notify::ChangeNotifier> notifier_;
};

} // namespace infragraph::core
