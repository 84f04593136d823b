#include "collision.h"

namespace comet {

int resolve_projectile_hits(ProjectileSystem &projectiles,
                            AsteroidField &field,
                            const FractureSystem &fracture, SimRng &rng,
                            TickReport &report) {
  if (field.empty() || projectiles.active_count() == 0)
    return 0;

  std::vector<uint8_t> struck(field.bodies.size(), 0);
  std::vector<ProjectileHandle> spent;
  std::vector<AsteroidFragment> spawned;

  projectiles.each_active([&](ProjectileHandle handle, const Projectile &p) {
    for (size_t i = 0; i < field.bodies.size(); i++) {
      if (struck[i])
        continue;
      const AsteroidFragment &rock = field.bodies[i];
      if (!circles_overlap(p.body.position, p.radius, rock.body.position,
                           rock.radius, rock.body.bounds))
        continue;

      struck[i] = 1;
      spent.push_back(handle);

      // Fragments scatter along the projectile's line of travel
      std::vector<AsteroidFragment> children =
          fracture.fracture_asteroid(rock, p.body.heading, rng);
      spawned.insert(spawned.end(), children.begin(), children.end());

      CollisionEvent ev;
      ev.kind = CollisionKind::AsteroidDestroyed;
      ev.entity_id = p.owner_id;
      ev.asteroid_serial = rock.serial;
      ev.tier = rock.tier;
      ev.points = rock.points;
      ev.position = rock.body.position;
      report.events.push_back(ev);
      report.score += rock.points;
      report.fragments_spawned += (int)children.size();
      return; // one hit per projectile
    }
  });

  // Release after the sweep: each_active walks the live list
  for (ProjectileHandle h : spent) {
    if (projectiles.release(h) == Status::Ok)
      report.projectiles_recycled++;
  }

  // Stable compaction: survivors keep their relative order
  int destroyed = 0;
  size_t keep = 0;
  for (size_t i = 0; i < field.bodies.size(); i++) {
    if (struck[i]) {
      destroyed++;
      continue;
    }
    if (keep != i)
      field.bodies[keep] = field.bodies[i];
    keep++;
  }
  field.bodies.resize(keep);
  field.add_all(spawned);

  report.asteroids_destroyed += destroyed;
  return destroyed;
}

std::vector<int> detect_ship_hits(const KineticEntity &ship, float ship_radius,
                                  const AsteroidField &field) {
  std::vector<int> hits;
  for (size_t i = 0; i < field.bodies.size(); i++) {
    const AsteroidFragment &rock = field.bodies[i];
    if (circles_overlap(ship.position, ship_radius, rock.body.position,
                        rock.radius, ship.bounds))
      hits.push_back((int)i);
  }
  return hits;
}

} // namespace comet
