#include "memory_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>

#include "logging/logger.hpp"

namespace cloudmock {
namespace store {

namespace {
constexpr const char *kStateRunning = "running";
constexpr const char *kStateStopped = "stopped";
constexpr const char *kTypeSmartMachine = "smartmachine";
constexpr const char *kTypeVirtualMachine = "virtualmachine";
constexpr const char *kAllVms = "all vms";

// RFC 3339 UTC timestamp, second precision
std::string now_rfc3339() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Stand-in for an MD5 key fingerprint: 16 colon-separated hex octets
std::string fingerprint_of(const std::string &key) {
    const uint64_t hi = std::hash<std::string>{}(key);
    const uint64_t lo = std::hash<std::string>{}(key + "#");
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        const uint64_t word = i < 8 ? hi : lo;
        const int shift = (7 - (i % 8)) * 8;
        if (i > 0) {
            out << ":";
        }
        out << std::setw(2) << ((word >> shift) & 0xFF);
    }
    return out.str();
}

// True when the filter set has no opinion on `key` or matches `value` exactly
bool filter_matches(const model::Filters &filters, const std::string &key, const std::string &value) {
    auto it = filters.find(key);
    return it == filters.end() || it->second == value;
}

const char *bool_text(bool value) { return value ? "true" : "false"; }

bool parse_non_negative(const std::string &text, const std::string &name, std::size_t &value, std::string &error) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        error = "Invalid " + name + " filter: '" + text + "'";
        return false;
    }
    try {
        value = static_cast<std::size_t>(std::stoul(text));
    } catch (const std::exception &) {
        error = "Invalid " + name + " filter: '" + text + "'";
        return false;
    }
    return true;
}

template <typename T, typename Pred>
T *find_in(std::vector<T> &items, Pred pred) {
    auto it = std::find_if(items.begin(), items.end(), pred);
    return it == items.end() ? nullptr : &*it;
}

}  // namespace

MemoryStore::MemoryStore() : rng_(std::random_device{}()) {}

//=============================================================================
// Seeding and failure injection
//=============================================================================

void MemoryStore::add_image(const model::Image &image) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    images_.push_back(image);
}

void MemoryStore::add_package(const model::Package &package) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    packages_.push_back(package);
}

void MemoryStore::add_network(const model::Network &network) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    networks_.push_back(network);
}

void MemoryStore::inject_failure(const std::string &operation, const std::string &message) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    failures_[operation] = message;
}

void MemoryStore::clear_failures() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    failures_.clear();
}

bool MemoryStore::injected_failure(const std::string &operation, std::string &error) const {
    auto it = failures_.find(operation);
    if (it == failures_.end()) {
        return false;
    }
    error = it->second;
    LOG_DEBUG("[Store] Injected failure for " << operation << ": " << error);
    return true;
}

//=============================================================================
// Keys
//=============================================================================

bool MemoryStore::list_keys(std::vector<model::Key> &keys, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_keys", error)) {
        return false;
    }
    keys = keys_;
    return true;
}

bool MemoryStore::get_key(const std::string &name, std::optional<model::Key> &key, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("get_key", error)) {
        return false;
    }
    key.reset();
    for (const auto &k : keys_) {
        if (k.name == name) {
            key = k;
            break;
        }
    }
    return true;
}

bool MemoryStore::create_key(const std::string &name, const std::string &key, model::Key &created,
                             std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("create_key", error)) {
        return false;
    }
    if (name.empty()) {
        error = "Key name is required";
        return false;
    }
    for (const auto &k : keys_) {
        if (k.name == name) {
            error = "Key " + name + " already exists";
            return false;
        }
    }

    created.name = name;
    created.key = key;
    created.fingerprint = fingerprint_of(key);
    keys_.push_back(created);
    LOG_DEBUG("[Store] Created key " << name);
    return true;
}

bool MemoryStore::delete_key(const std::string &name, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("delete_key", error)) {
        return false;
    }
    auto it = std::find_if(keys_.begin(), keys_.end(), [&name](const model::Key &k) { return k.name == name; });
    if (it == keys_.end()) {
        error = "Key " + name + " not found";
        return false;
    }
    keys_.erase(it);
    return true;
}

//=============================================================================
// Images
//=============================================================================

bool MemoryStore::list_images(const model::OptionalFilters &filters, std::vector<model::Image> &images,
                              std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_images", error)) {
        return false;
    }
    images.clear();
    for (const auto &image : images_) {
        if (filters) {
            const auto &f = *filters;
            if (!filter_matches(f, "name", image.name) || !filter_matches(f, "os", image.os) ||
                !filter_matches(f, "version", image.version) || !filter_matches(f, "type", image.type) ||
                !filter_matches(f, "state", image.state) || !filter_matches(f, "public", bool_text(image.is_public))) {
                continue;
            }
        }
        images.push_back(image);
    }
    return true;
}

bool MemoryStore::get_image(const std::string &id, std::optional<model::Image> &image, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("get_image", error)) {
        return false;
    }
    image.reset();
    for (const auto &i : images_) {
        if (i.id == id) {
            image = i;
            break;
        }
    }
    return true;
}

const model::Image *MemoryStore::find_image(const std::string &name_or_id) const {
    for (const auto &image : images_) {
        if (image.id == name_or_id || image.name == name_or_id) {
            return &image;
        }
    }
    return nullptr;
}

//=============================================================================
// Packages
//=============================================================================

bool MemoryStore::list_packages(const model::OptionalFilters &filters, std::vector<model::Package> &packages,
                                std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_packages", error)) {
        return false;
    }
    packages.clear();
    for (const auto &pkg : packages_) {
        if (filters) {
            const auto &f = *filters;
            if (!filter_matches(f, "name", pkg.name) || !filter_matches(f, "memory", std::to_string(pkg.memory)) ||
                !filter_matches(f, "disk", std::to_string(pkg.disk)) ||
                !filter_matches(f, "swap", std::to_string(pkg.swap)) ||
                !filter_matches(f, "vcpus", std::to_string(pkg.vcpus)) || !filter_matches(f, "version", pkg.version) ||
                !filter_matches(f, "group", pkg.group)) {
                continue;
            }
        }
        packages.push_back(pkg);
    }
    return true;
}

bool MemoryStore::get_package(const std::string &name, std::optional<model::Package> &package, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("get_package", error)) {
        return false;
    }
    package.reset();
    if (const auto *found = find_package(name)) {
        package = *found;
    }
    return true;
}

const model::Package *MemoryStore::find_package(const std::string &name_or_id) const {
    for (const auto &pkg : packages_) {
        if (pkg.name == name_or_id || pkg.id == name_or_id) {
            return &pkg;
        }
    }
    return nullptr;
}

//=============================================================================
// Machines
//=============================================================================

bool MemoryStore::list_machines(const model::OptionalFilters &filters, std::vector<model::Machine> &machines,
                                std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_machines", error)) {
        return false;
    }

    std::size_t offset = 0;
    std::size_t limit = machines_.size();
    if (filters) {
        auto it = filters->find("offset");
        if (it != filters->end() && !parse_non_negative(it->second, "offset", offset, error)) {
            return false;
        }
        it = filters->find("limit");
        if (it != filters->end() && !parse_non_negative(it->second, "limit", limit, error)) {
            return false;
        }
    }

    machines.clear();
    std::size_t skipped = 0;
    for (const auto &m : machines_) {
        if (machines.size() >= limit) {
            break;
        }
        if (filters) {
            const auto &f = *filters;
            if (!filter_matches(f, "name", m.name) || !filter_matches(f, "type", m.type) ||
                !filter_matches(f, "state", m.state) || !filter_matches(f, "image", m.image) ||
                !filter_matches(f, "package", m.package) || !filter_matches(f, "memory", std::to_string(m.memory))) {
                continue;
            }
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        machines.push_back(m);
    }
    return true;
}

bool MemoryStore::count_machines(std::size_t &count, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("count_machines", error)) {
        return false;
    }
    count = machines_.size();
    return true;
}

bool MemoryStore::get_machine(const std::string &id, std::optional<model::Machine> &machine, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("get_machine", error)) {
        return false;
    }
    machine.reset();
    for (const auto &m : machines_) {
        if (m.id == id) {
            machine = m;
            break;
        }
    }
    return true;
}

bool MemoryStore::create_machine(const model::CreateMachineRequest &request, model::Machine &created,
                                 std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("create_machine", error)) {
        return false;
    }

    const auto *pkg = find_package(request.package);
    if (pkg == nullptr) {
        error = "Package " + request.package + " not found";
        return false;
    }
    const auto *image = find_image(request.image);
    if (image == nullptr) {
        error = "Image " + request.image + " not found";
        return false;
    }

    model::Machine machine;
    machine.id = generate_id();
    machine.name = request.name.empty() ? "machine-" + machine.id.substr(0, 8) : request.name;
    machine.type = image->type == "zvol" ? kTypeVirtualMachine : kTypeSmartMachine;
    machine.state = kStateRunning;
    machine.dataset = image->id;
    machine.memory = pkg->memory;
    machine.disk = pkg->disk;
    machine.primary_ip = next_private_ip();
    machine.ips.push_back(machine.primary_ip);
    machine.metadata = request.metadata;
    machine.tags = request.tags;
    machine.created = now_rfc3339();
    machine.updated = machine.created;
    machine.package = pkg->name;
    machine.image = image->id;

    if (request.networks) {
        machine.networks = *request.networks;
    } else {
        for (const auto &net : networks_) {
            machine.networks.push_back(net.id);
        }
    }

    machines_.push_back(machine);
    created = machine;
    LOG_DEBUG("[Store] Created machine " << machine.id << " (" << machine.name << ")");
    return true;
}

bool MemoryStore::delete_machine(const std::string &id, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("delete_machine", error)) {
        return false;
    }
    auto it = std::find_if(machines_.begin(), machines_.end(), [&id](const model::Machine &m) { return m.id == id; });
    if (it == machines_.end()) {
        error = "Machine " + id + " not found";
        return false;
    }
    machines_.erase(it);
    return true;
}

model::Machine *MemoryStore::find_machine(const std::string &id) {
    return find_in(machines_, [&id](const model::Machine &m) { return m.id == id; });
}

bool MemoryStore::set_machine_state(const std::string &operation, const std::string &id, const std::string &state,
                                    std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure(operation, error)) {
        return false;
    }
    auto *machine = find_machine(id);
    if (machine == nullptr) {
        error = "Machine " + id + " not found";
        return false;
    }
    machine->state = state;
    machine->updated = now_rfc3339();
    return true;
}

bool MemoryStore::stop_machine(const std::string &id, std::string &error) {
    return set_machine_state("stop_machine", id, kStateStopped, error);
}

bool MemoryStore::start_machine(const std::string &id, std::string &error) {
    return set_machine_state("start_machine", id, kStateRunning, error);
}

bool MemoryStore::reboot_machine(const std::string &id, std::string &error) {
    return set_machine_state("reboot_machine", id, kStateRunning, error);
}

bool MemoryStore::resize_machine(const std::string &id, const std::string &package, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("resize_machine", error)) {
        return false;
    }
    auto *machine = find_machine(id);
    if (machine == nullptr) {
        error = "Machine " + id + " not found";
        return false;
    }
    const auto *pkg = find_package(package);
    if (pkg == nullptr) {
        error = "Package " + package + " not found";
        return false;
    }
    machine->package = pkg->name;
    machine->memory = pkg->memory;
    machine->disk = pkg->disk;
    machine->updated = now_rfc3339();
    return true;
}

bool MemoryStore::rename_machine(const std::string &id, const std::string &name, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("rename_machine", error)) {
        return false;
    }
    auto *machine = find_machine(id);
    if (machine == nullptr) {
        error = "Machine " + id + " not found";
        return false;
    }
    machine->name = name;
    machine->updated = now_rfc3339();
    return true;
}

bool MemoryStore::set_machine_firewall(const std::string &operation, const std::string &id, bool enabled,
                                       std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure(operation, error)) {
        return false;
    }
    auto *machine = find_machine(id);
    if (machine == nullptr) {
        error = "Machine " + id + " not found";
        return false;
    }
    machine->firewall_enabled = enabled;
    machine->updated = now_rfc3339();
    return true;
}

bool MemoryStore::enable_machine_firewall(const std::string &id, std::string &error) {
    return set_machine_firewall("enable_machine_firewall", id, true, error);
}

bool MemoryStore::disable_machine_firewall(const std::string &id, std::string &error) {
    return set_machine_firewall("disable_machine_firewall", id, false, error);
}

bool MemoryStore::list_machine_firewall_rules(const std::string &machine_id, std::vector<model::FirewallRule> &rules,
                                              std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_machine_firewall_rules", error)) {
        return false;
    }
    rules.clear();
    for (const auto &rule : rules_) {
        if (rule.rule.find(machine_id) != std::string::npos || rule.rule.find(kAllVms) != std::string::npos) {
            rules.push_back(rule);
        }
    }
    return true;
}

//=============================================================================
// Firewall rules
//=============================================================================

bool MemoryStore::list_firewall_rules(std::vector<model::FirewallRule> &rules, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_firewall_rules", error)) {
        return false;
    }
    rules = rules_;
    return true;
}

bool MemoryStore::get_firewall_rule(const std::string &id, std::optional<model::FirewallRule> &rule,
                                    std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("get_firewall_rule", error)) {
        return false;
    }
    rule.reset();
    for (const auto &r : rules_) {
        if (r.id == id) {
            rule = r;
            break;
        }
    }
    return true;
}

bool MemoryStore::create_firewall_rule(const model::FirewallRuleOpts &opts, model::FirewallRule &created,
                                       std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("create_firewall_rule", error)) {
        return false;
    }
    created.id = generate_id();
    created.rule = opts.rule;
    created.enabled = opts.enabled;
    rules_.push_back(created);
    LOG_DEBUG("[Store] Created firewall rule " << created.id);
    return true;
}

model::FirewallRule *MemoryStore::find_rule(const std::string &id) {
    return find_in(rules_, [&id](const model::FirewallRule &r) { return r.id == id; });
}

bool MemoryStore::update_firewall_rule(const std::string &id, const model::FirewallRuleOpts &opts,
                                       model::FirewallRule &updated, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("update_firewall_rule", error)) {
        return false;
    }
    auto *rule = find_rule(id);
    if (rule == nullptr) {
        error = "Firewall rule " + id + " not found";
        return false;
    }
    rule->rule = opts.rule;
    rule->enabled = opts.enabled;
    updated = *rule;
    return true;
}

bool MemoryStore::set_rule_enabled(const std::string &operation, const std::string &id, bool enabled,
                                   model::FirewallRule &updated, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure(operation, error)) {
        return false;
    }
    auto *rule = find_rule(id);
    if (rule == nullptr) {
        error = "Firewall rule " + id + " not found";
        return false;
    }
    rule->enabled = enabled;
    updated = *rule;
    return true;
}

bool MemoryStore::enable_firewall_rule(const std::string &id, model::FirewallRule &updated, std::string &error) {
    return set_rule_enabled("enable_firewall_rule", id, true, updated, error);
}

bool MemoryStore::disable_firewall_rule(const std::string &id, model::FirewallRule &updated, std::string &error) {
    return set_rule_enabled("disable_firewall_rule", id, false, updated, error);
}

bool MemoryStore::delete_firewall_rule(const std::string &id, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("delete_firewall_rule", error)) {
        return false;
    }
    auto it = std::find_if(rules_.begin(), rules_.end(), [&id](const model::FirewallRule &r) { return r.id == id; });
    if (it == rules_.end()) {
        error = "Firewall rule " + id + " not found";
        return false;
    }
    rules_.erase(it);
    return true;
}

//=============================================================================
// Networks
//=============================================================================

bool MemoryStore::list_networks(std::vector<model::Network> &networks, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("list_networks", error)) {
        return false;
    }
    networks = networks_;
    return true;
}

bool MemoryStore::get_network(const std::string &id, std::optional<model::Network> &network, std::string &error) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (injected_failure("get_network", error)) {
        return false;
    }
    network.reset();
    for (const auto &n : networks_) {
        if (n.id == id) {
            network = n;
            break;
        }
    }
    return true;
}

//=============================================================================
// Identifiers
//=============================================================================

// Random RFC 4122 version 4 UUID
std::string MemoryStore::generate_id() {
    std::uniform_int_distribution<uint32_t> dist(0, 15);
    static const char *kHex = "0123456789abcdef";
    std::string id = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for (auto &c : id) {
        if (c == 'x') {
            c = kHex[dist(rng_)];
        } else if (c == 'y') {
            c = kHex[8 + (dist(rng_) & 0x3)];
        }
    }
    return id;
}

std::string MemoryStore::next_private_ip() {
    ++ip_counter_;
    return "10.88.88." + std::to_string(2 + (ip_counter_ - 1) % 250);
}

}  // namespace store
}  // namespace cloudmock
