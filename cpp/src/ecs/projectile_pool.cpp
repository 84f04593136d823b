#include "projectile_pool.h"
#include <algorithm>

namespace comet {

ProjectileSystem::ProjectileSystem(const ProjectileConfig &config)
    : config_(config) {
  if (config.pool_size <= 0)
    throw ConfigError("projectile pool_size must be > 0 (got " +
                      std::to_string(config.pool_size) + ")");
  if (!(config.cooldown_ms >= 0.0f))
    throw ConfigError("projectile cooldown_ms must be >= 0 (got " +
                      std::to_string(config.cooldown_ms) + ")");
  if (!(config.lifetime > 0.0f))
    throw ConfigError("projectile lifetime must be > 0");
  if (!(config.radius > 0.0f))
    throw ConfigError("projectile radius must be > 0");

  cooldown_s_ = (double)config.cooldown_ms / 1000.0;

  slots_.resize((size_t)config.pool_size);
  free_slots_.reserve(slots_.size());
  active_slots_.reserve(slots_.size());

  // Pop order = ascending slot index
  for (int i = config.pool_size - 1; i >= 0; i--)
    free_slots_.push_back((uint32_t)i);
}

double ProjectileSystem::get_cooldown_remaining(uint64_t owner_id,
                                                double now) const {
  auto it = last_fire_time_.find(owner_id);
  if (it == last_fire_time_.end())
    return 0.0;
  double ready_at = it->second + cooldown_s_;
  if (now >= ready_at)
    return 0.0;
  return ready_at - now;
}

bool ProjectileSystem::can_fire(uint64_t owner_id, double now) const {
  if (free_slots_.empty())
    return false;
  // Same comparison as get_cooldown_remaining so the two never disagree
  return get_cooldown_remaining(owner_id, now) <= 0.0;
}

Result<ProjectileHandle>
ProjectileSystem::fire_projectile(uint64_t owner_id, Vec2 origin, float angle,
                                  double now, float damage, float speed) {
  if (!can_fire(owner_id, now))
    return {Status::ResourceExhausted, {}};

  uint32_t slot = free_slots_.back();
  free_slots_.pop_back();

  Projectile &p = slots_[slot];
  p.body = KineticEntity{};
  p.body.bounds = config_.bounds;
  p.body.position = origin;
  p.body.heading = wrap_angle(angle);
  p.body.velocity = Vec2::from_angle(angle, speed);
  p.body.max_velocity = speed > 0.0f ? speed : 0.0f;
  p.body.drag = 0.0f;
  p.body.wrap_position();
  p.owner_id = owner_id;
  p.damage = damage;
  p.radius = config_.radius;
  p.spawn_time = now;
  p.lifetime = config_.lifetime;
  p.active = true;

  active_slots_.push_back(slot);
  last_fire_time_[owner_id] = now;
  total_fired_++;

  return {Status::Ok, ProjectileHandle{slot, p.generation}};
}

void ProjectileSystem::integrate(float dt) {
  for (uint32_t slot : active_slots_)
    slots_[slot].body.update(dt);
}

void ProjectileSystem::recycle_slot(uint32_t slot) {
  Projectile &p = slots_[slot];
  p.active = false;
  p.generation++;
  p.body.velocity = {};
  free_slots_.push_back(slot);
}

int ProjectileSystem::sweep_expired(double now) {
  // In-place compaction keeps the survivors in firing order
  int expired = 0;
  size_t keep = 0;
  for (size_t i = 0; i < active_slots_.size(); i++) {
    uint32_t slot = active_slots_[i];
    const Projectile &p = slots_[slot];
    if (now - p.spawn_time > (double)p.lifetime) {
      recycle_slot(slot);
      expired++;
      continue;
    }
    active_slots_[keep++] = slot;
  }
  active_slots_.resize(keep);
  total_expired_ += (uint64_t)expired;
  return expired;
}

int ProjectileSystem::update(float dt, double now) {
  integrate(dt);
  return sweep_expired(now);
}

bool ProjectileSystem::is_live(ProjectileHandle handle) const {
  if (handle.slot >= slots_.size())
    return false;
  const Projectile &p = slots_[handle.slot];
  return p.active && p.generation == handle.generation;
}

Status ProjectileSystem::release(ProjectileHandle handle) {
  if (!is_live(handle))
    return Status::UnknownEntity;

  auto it = std::find(active_slots_.begin(), active_slots_.end(), handle.slot);
  active_slots_.erase(it);
  recycle_slot(handle.slot);
  total_recycled_++;
  return Status::Ok;
}

Result<const Projectile *> ProjectileSystem::get(ProjectileHandle handle) const {
  if (!is_live(handle))
    return {Status::UnknownEntity, nullptr};
  return {Status::Ok, &slots_[handle.slot]};
}

void ProjectileSystem::clear() {
  for (uint32_t slot : active_slots_)
    recycle_slot(slot);
  total_recycled_ += active_slots_.size();
  active_slots_.clear();
}

} // namespace comet
