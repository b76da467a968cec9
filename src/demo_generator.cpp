#include "demo_generator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <set>

#include "track_map.hpp"

#define DEMO_LAP_TIME_MS 90000.0
#define DEMO_SESSION_LENGTH_S 3600.0
#define DEMO_RACE_LAPS 50
#define DEMO_BATTLE_GAP_PCT 0.02
#define DEMO_SWAP_CHANCE 0.02

static const char* const FIRST_NAMES[] = {
    "Ana", "Ben", "Carla", "Dev", "Elif", "Femi", "Greta", "Hugo", "Ines", "Jonas",
    "Kai", "Lena", "Mateo", "Nora", "Otto", "Pia", "Quinn", "Rafa", "Sami", "Tess"
};

static const char* const LAST_NAMES[] = {
    "Almeida", "Brandt", "Castillo", "Dufour", "Eriksen", "Fontana", "Gallagher",
    "Horvath", "Ivanova", "Jansen", "Kowalski", "Lindqvist", "Moreau", "Nakamura",
    "Okafor", "Petrov", "Quintero", "Rossi", "Sato", "Tanaka"
};

static const char* const TEAM_NAMES[] = {
    "Apex Motorsport", "Blue Line Racing", "Crestwood", "Delta Works", "Eastgate",
    "Falcon GP", "Granite Racing", "Harbor Speed", "Ironbark", "Junction 9"
};

static const char* const TRACK_NAMES[] = {
    "Northfield Raceway", "Lakeside Circuit", "Redhill Park", "Coastline GP",
    "Valley Speedway", "Summit Ring"
};


double Mulberry32::next() {
    state += 0x6D2B79F5u;
    uint32_t t = state;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return (t ^ (t >> 14)) / 4294967296.0;
}

uint32_t hash_string(std::string_view text) {
    uint32_t hash = 0;
    for (unsigned char c : text) {
        hash = hash * 31u + c;
    }
    const int32_t signed_hash = static_cast<int32_t>(hash);
    return signed_hash < 0 ? static_cast<uint32_t>(-static_cast<int64_t>(signed_hash)) : hash;
}

DemoGenerator::DemoGenerator(const DemoConfig& config)
    : rng(hash_string(std::format("{}-{}", config.session_id, config.seed.empty() ? "default" : config.seed)))
    , session_id(config.session_id)
    , epoch_ms(config.epoch_ms)
    , session_type(config.session_type)
{
    // draw order matters: it is what makes a seed reproducible
    car_count = config.car_count > 0 ? config.car_count : 20 + static_cast<uint32_t>(rng.next() * 40);
    track_name = !config.track_name.empty() ? config.track_name
        : TRACK_NAMES[pick(std::size(TRACK_NAMES))];

    std::set<std::string> used_numbers;
    for (uint32_t i = 0; i < car_count; i++) {
        const std::string first = FIRST_NAMES[pick(std::size(FIRST_NAMES))];
        const std::string last = LAST_NAMES[pick(std::size(LAST_NAMES))];
        const std::string team = TEAM_NAMES[pick(std::size(TEAM_NAMES))];

        // 99 numbers for at most 59 cars; always terminates
        std::string number;
        do {
            number = std::to_string(pick(99) + 1);
        } while (used_numbers.count(number) > 0 && used_numbers.size() < 99);
        used_numbers.insert(number);

        drivers.push_back(DemoDriver {
            .driver_id = std::format("demo-driver-{}", i),
            .driver_name = first + " " + last,
            .car_number = number,
            .team_name = team
        });
    }

    for (uint32_t i = 0; i < car_count; i++) {
        positions.push_back(i + 1);
        lap_dist_pcts.push_back(std::fmod(1.0 - std::fmod(i * 0.03, 1.0), 1.0));
        speeds.push_back(150.0 + rng.next() * 100.0);
        laps.push_back(1);
    }
}

void DemoGenerator::advance(uint64_t delta_ms) {
    simulation_time_ms += delta_ms;

    const double dist_per_ms = 1.0 / DEMO_LAP_TIME_MS;

    for (uint32_t i = 0; i < car_count; i++) {
        const double speed_factor = 0.95 + rng.next() * 0.1;
        double dist = dist_per_ms * delta_ms * speed_factor;

        // close to the car ahead: randomize who is faster
        if (i > 0 && std::fabs(wrap_safe_delta(lap_dist_pcts[i - 1], lap_dist_pcts[i])) < DEMO_BATTLE_GAP_PCT) {
            dist *= 0.99 + rng.next() * 0.02;
        }
        lap_dist_pcts[i] += dist;

        if (lap_dist_pcts[i] >= 1.0) {
            lap_dist_pcts[i] -= 1.0;
            laps[i]++;
            if (i == 0) {
                current_lap = laps[0];
            }
        }

        speeds[i] = 150.0 + std::sin(simulation_time_ms / 1000.0 + i) * 50.0 + rng.next() * 50.0;
    }

    if (car_count > 1 && rng.next() < DEMO_SWAP_CHANCE) {
        const size_t idx = pick(car_count - 1);
        std::swap(positions[idx], positions[idx + 1]);
    }
}

SessionTiming DemoGenerator::generate_timing() {
    std::vector<TimingEntry> entries;
    entries.reserve(car_count);

    for (uint32_t i = 0; i < car_count; i++) {
        const DemoDriver& driver = drivers[i];
        TimingEntry entry {
            .driver_id = driver.driver_id,
            .driver_name = driver.driver_name,
            .car_number = driver.car_number,
            .team_name = driver.team_name,
            .position = positions[i],
            .lap_number = laps[i],
            .lap_dist_pct = lap_dist_pcts[i],
            .last_lap_time = 88000.0 + rng.next() * 4000.0,
            .best_lap_time = 87000.0 + rng.next() * 2000.0,
            .gap_to_leader = i * (0.5 + rng.next() * 1.5),
            .gap_ahead = std::nullopt,
            .speed = speeds[i],
            .sector = static_cast<int32_t>(lap_dist_pcts[i] * 3) + 1,
        };
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const TimingEntry& a, const TimingEntry& b) {
        return a.position < b.position;
    });

    const std::string leader_id = entries.front().driver_id;
    const double elapsed_s = simulation_time_ms / 1000.0;
    return SessionTiming {
        .session_id = session_id,
        .entries = std::move(entries),
        .session_state = "racing",
        .session_time_elapsed = elapsed_s,
        .session_time_remaining = std::max(0.0, DEMO_SESSION_LENGTH_S - elapsed_s),
        .laps_remaining = std::max(0, DEMO_RACE_LAPS - current_lap),
        .leader_id = leader_id,
        .fastest_lap = FastestLap {
            .driver_id = leader_id,
            .time = 87500.0,
            .lap = std::max(1, current_lap - 1)
        },
        .timestamp = epoch_ms + simulation_time_ms
    };
}

ThinFrame DemoGenerator::generate_frame() {
    const size_t featured = static_cast<size_t>(simulation_time_ms / 5000) % car_count;
    const double speed = speeds[featured];

    const double throttle = 0.3 + rng.next() * 0.7;
    const double brake = rng.next() < 0.2 ? rng.next() * 0.5 : 0.0;

    return ThinFrame {
        .session_id = session_id,
        .timestamp = epoch_ms + simulation_time_ms,
        .driver_id = drivers[featured].driver_id,
        .speed = speed,
        .gear = static_cast<int32_t>(1 + speed / 50.0),
        .rpm = 5000.0 + speed * 40.0,
        .lap = laps[featured],
        .lap_progress = lap_dist_pcts[featured],
        .position = positions[featured],
        .throttle = throttle,
        .brake = brake
    };
}
