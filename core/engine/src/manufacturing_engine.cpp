#include "mfg/engine/manufacturing_engine.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/events/event_types.hpp"
#include "mfg/network/json_codec.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace mfg {

using nlohmann::json;

namespace {

const std::string kDefaultActor = "system";

// -----------------------------------------------------------------------------
// Request field decoding
// -----------------------------------------------------------------------------
// Missing or null fields and wrong JSON types all surface as
// ValidationError naming the field.

template <typename T>
T field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw ValidationError(std::string("Missing field '") + key + "'");
  }
  try {
    return it->get<T>();
  } catch (const json::type_error&) {
    throw ValidationError(std::string("Field '") + key +
                          "' has the wrong type");
  }
}

template <typename T>
T fieldOr(const json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return field<T>(j, key);
}

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return field<T>(j, key);
}

CalendarDate dateField(const json& j, const char* key) {
  return CalendarDate::parse(field<std::string>(j, key));
}

std::optional<CalendarDate> optionalDate(const json& j, const char* key) {
  auto text = optionalField<std::string>(j, key);
  if (!text || text->empty()) {
    return std::nullopt;
  }
  return CalendarDate::parse(*text);
}

template <typename Enum>
Enum enumField(const json& j,
               const char* key,
               std::optional<Enum> (*parse)(const std::string&)) {
  const auto text = field<std::string>(j, key);
  auto value = parse(text);
  if (!value) {
    throw ValidationError(std::string("Unknown value '") + text +
                          "' for field '" + key + "'");
  }
  return *value;
}

template <typename Enum>
std::optional<Enum> optionalEnum(
    const json& j,
    const char* key,
    std::optional<Enum> (*parse)(const std::string&)) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return enumField(j, key, parse);
}

BomDraft parseBomDraft(const json& j) {
  BomDraft draft;
  draft.name = field<std::string>(j, "name");
  draft.type = enumField(j, "type", &domain::parseBomType);
  draft.output_product_id = field<domain::ProductId>(j, "output_product_id");
  draft.output_qty = fieldOr(j, "output_qty", 1.0);
  draft.uom = fieldOr<std::string>(j, "uom", "");
  draft.effective_date = optionalDate(j, "effective_date");
  draft.notes = fieldOr<std::string>(j, "notes", "");

  for (const auto& item : j.value("lines", json::array())) {
    domain::BomLine line;
    line.material_id = field<domain::ProductId>(item, "material_id");
    line.material_type =
        optionalEnum(item, "material_type", &domain::parseMaterialType)
            .value_or(domain::MaterialType::RawMaterial);
    line.qty_per_unit = field<double>(item, "qty_per_unit");
    line.uom = fieldOr<std::string>(item, "uom", "");
    line.scrap_rate_pct = fieldOr(item, "scrap_rate_pct", 0.0);
    draft.lines.push_back(std::move(line));
  }
  return draft;
}

StockReceiptRequest parseStockReceipt(const json& j) {
  StockReceiptRequest request;
  request.product_id = field<domain::ProductId>(j, "product_id");
  request.warehouse_id = field<domain::WarehouseId>(j, "warehouse_id");
  request.batch_no = field<std::string>(j, "batch_no");
  request.quantity = field<double>(j, "quantity");
  request.expiry = optionalDate(j, "expiry");
  request.source_ref = fieldOr<std::string>(j, "source_ref", "");
  return request;
}

json errorReply(const char* kind, const std::string& message) {
  return json{{"status", "error"}, {"error", kind}, {"message", message}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the component graph leaf first
// -----------------------------------------------------------------------------
ManufacturingEngine::ManufacturingEngine(domain::EngineConfig config,
                                         const ITimeProvider& time_provider)
    : config_(std::move(config)), time_provider_(time_provider) {
  master_data_ = std::make_unique<InMemoryMasterDataRegistry>();
  event_bus_ = std::make_unique<EventBus>();
  numbers_ = std::make_unique<DocumentNumberGenerator>(time_provider_);
  ledger_ = std::make_unique<InventoryLedger>(*master_data_, time_provider_,
                                              config_);
  orders_ = std::make_unique<OrderRepository>();
  boms_ = std::make_unique<BomRegistry>(*master_data_, time_provider_);
  genealogy_ = std::make_unique<GenealogyTracker>(
      *ledger_, *orders_, *boms_, *master_data_, time_provider_);
  allocator_ =
      std::make_unique<FefoAllocator>(*ledger_, time_provider_, config_);
  order_service_ = std::make_unique<ManufacturingOrderService>(
      *boms_, *ledger_, *orders_, *genealogy_, *allocator_, *numbers_,
      *master_data_, time_provider_, *event_bus_, event_sequence_, config_);
  reports_ = std::make_unique<ProductionReports>(*orders_, *master_data_);

  registerHandlers();
}

ManufacturingEngine::~ManufacturingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): IPC server + telemetry bridge
// -----------------------------------------------------------------------------
void ManufacturingEngine::start() {
  if (running_) {
    return;
  }

  // Skip if no endpoint was configured (unit tests drive executeCommand()).
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    telemetry_subscription_ = event_bus_->subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[ManufacturingEngine] started"
            << (ipc_server_ ? " with IPC." : " without IPC.") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ManufacturingEngine::stop() {
  if (!running_) {
    return;
  }

  if (telemetry_subscription_) {
    event_bus_->unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }

  // Joins the IPC thread before anything executeCommand() touches goes away.
  ipc_server_.reset();

  running_ = false;

  std::cout << "[ManufacturingEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// Commands that publish engine-level events
// -----------------------------------------------------------------------------
domain::LedgerEntry ManufacturingEngine::receiveStock(
    const StockReceiptRequest& request, const std::string& actor) {
  auto lot = ledger_->receiveStock(request, actor);

  StockReceivedEvent event;
  event.lot = lot;
  event.timestamp_ms = lot.created_at_ms;
  event.sequence_id = event_sequence_.next_id();
  event_bus_->publish(event);
  return lot;
}

domain::BomHeader ManufacturingEngine::createBom(const BomDraft& draft,
                                                 const std::string& actor) {
  return boms_->createBom(draft, actor);
}

domain::BomHeader ManufacturingEngine::updateBomStatus(
    domain::BomId bom_id, domain::BomStatus status, const std::string& actor) {
  const domain::BomStatus previous = boms_->get(bom_id).status;
  auto bom = boms_->updateStatus(bom_id, status, actor);

  BomStatusChangedEvent event;
  event.bom_id = bom.id;
  event.bom_code = bom.code;
  event.previous_status = previous;
  event.status = bom.status;
  event.timestamp_ms = time_provider_.now_ms();
  event.sequence_id = event_sequence_.next_id();
  event_bus_->publish(event);
  return bom;
}

// -----------------------------------------------------------------------------
// loadSeed(): master data, BOMs, opening stock
// -----------------------------------------------------------------------------
void ManufacturingEngine::loadSeed(const json& seed) {
  if (!seed.is_object()) {
    throw ValidationError("Seed document must be a JSON object");
  }

  try {
    for (const auto& item : seed.value("products", json::array())) {
      domain::Product product;
      product.id = field<domain::ProductId>(item, "id");
      product.code = field<std::string>(item, "code");
      product.name = field<std::string>(item, "name");
      product.uom = field<std::string>(item, "uom");
      product.is_service = fieldOr(item, "is_service", false);
      product.approved = fieldOr(item, "approved", true);
      master_data_->upsertProduct(product);
    }

    for (const auto& item : seed.value("warehouses", json::array())) {
      domain::Warehouse warehouse;
      warehouse.id = field<domain::WarehouseId>(item, "id");
      warehouse.name = field<std::string>(item, "name");
      warehouse.entity_id = fieldOr<domain::EntityId>(item, "entity_id", 0);
      warehouse.active = fieldOr(item, "active", true);
      master_data_->upsertWarehouse(warehouse);
    }

    int bom_count = 0;
    for (const auto& item : seed.value("boms", json::array())) {
      auto bom = createBom(parseBomDraft(item), "seed");
      const auto status =
          optionalEnum(item, "status", &domain::parseBomStatus)
              .value_or(domain::BomStatus::Draft);
      if (status != domain::BomStatus::Draft) {
        updateBomStatus(bom.id, status, "seed");
      }
      ++bom_count;
    }

    int lot_count = 0;
    for (const auto& item : seed.value("stock", json::array())) {
      auto request = parseStockReceipt(item);
      if (request.source_ref.empty()) {
        request.source_ref = "OPENING";
      }
      receiveStock(request, "seed");
      ++lot_count;
    }

    std::cout << "[ManufacturingEngine] Seed loaded: "
              << master_data_->products().size() << " product(s), "
              << master_data_->warehouses().size() << " warehouse(s), "
              << bom_count << " BOM(s), " << lot_count << " lot(s).\n";
  } catch (const json::exception& e) {
    throw ValidationError(std::string("Malformed seed document: ") + e.what());
  }
}

void ManufacturingEngine::loadSeedFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("Cannot open seed file: " + path);
  }
  json seed;
  try {
    in >> seed;
  } catch (const json::parse_error& e) {
    throw ValidationError("Seed file " + path + " is not valid JSON: " +
                          e.what());
  }
  loadSeed(seed);
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON text in, JSON text out
// -----------------------------------------------------------------------------
std::string ManufacturingEngine::executeCommand(const std::string& request) {
  json parsed;
  if (request == "PING" || request == "STATUS") {
    parsed = json{{"command", request}};
  } else {
    try {
      parsed = json::parse(request);
    } catch (const json::parse_error& e) {
      return errorReply("ValidationError",
                        std::string("Malformed JSON request: ") + e.what())
          .dump();
    }
  }
  return handleRequest(parsed).dump(-1, ' ', false,
                                    json::error_handler_t::replace);
}

json ManufacturingEngine::handleRequest(const json& request) {
  std::string command;
  try {
    if (!request.is_object()) {
      throw ValidationError("Request must be a JSON object");
    }
    command = field<std::string>(request, "command");

    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
      throw ValidationError("Unknown command: " + command);
    }

    json reply = it->second(request);
    reply["status"] = "ok";
    reply["command"] = command;
    return reply;
  } catch (const InsufficientStockError& e) {
    std::cerr << "[ManufacturingEngine] " << command
              << " rejected: " << e.what() << "\n";
    json reply = errorReply(errorKindToString(e.kind()), e.what());
    reply["material_id"] = e.materialId();
    reply["warehouse_id"] = e.warehouseId();
    reply["requested"] = e.requested();
    reply["available"] = e.available();
    return reply;
  } catch (const EngineError& e) {
    std::cerr << "[ManufacturingEngine] " << command
              << " rejected: " << e.what() << "\n";
    return errorReply(errorKindToString(e.kind()), e.what());
  } catch (const json::exception& e) {
    std::cerr << "[ManufacturingEngine] " << command
              << " rejected: " << e.what() << "\n";
    return errorReply("ValidationError", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[ManufacturingEngine] ERROR: " << command
              << " failed: " << e.what() << "\n";
    return errorReply("InternalError", e.what());
  }
}

// -----------------------------------------------------------------------------
// registerHandlers(): command name -> handler
// -----------------------------------------------------------------------------
void ManufacturingEngine::registerHandlers() {
  auto actorOf = [](const json& r) {
    return fieldOr<std::string>(r, "actor", kDefaultActor);
  };

  // --- Meta -----------------------------------------------------------------
  handlers_["PING"] = [](const json&) { return json{{"response", "PONG"}}; };
  handlers_["STATUS"] = [this](const json&) { return status(); };

  // --- Order lifecycle commands ---------------------------------------------
  handlers_["createOrder"] = [this, actorOf](const json& r) {
    CreateOrderRequest request;
    request.bom_id = field<domain::BomId>(r, "bom_id");
    request.planned_qty = field<double>(r, "planned_qty");
    request.source_warehouse_id =
        field<domain::WarehouseId>(r, "source_warehouse_id");
    request.target_warehouse_id =
        field<domain::WarehouseId>(r, "target_warehouse_id");
    request.scheduled_date = optionalDate(r, "scheduled_date");
    request.priority = optionalEnum(r, "priority", &domain::parsePriority)
                           .value_or(domain::Priority::Normal);
    request.notes = fieldOr<std::string>(r, "notes", "");
    return json{{"order", order_service_->createOrder(request, actorOf(r))}};
  };

  handlers_["issueMaterials"] = [this, actorOf](const json& r) {
    return json{{"issue", order_service_->issueMaterials(
                              field<domain::OrderId>(r, "order_id"),
                              actorOf(r))}};
  };

  handlers_["completeOrder"] = [this, actorOf](const json& r) {
    CompleteOrderRequest request;
    request.order_id = field<domain::OrderId>(r, "order_id");
    request.produced_qty = field<double>(r, "produced_qty");
    request.batch_no = field<std::string>(r, "batch_no");
    request.quality_status =
        optionalEnum(r, "quality_status", &domain::parseQualityStatus)
            .value_or(domain::QualityStatus::Pending);
    request.notes = fieldOr<std::string>(r, "notes", "");
    request.expiry = optionalDate(r, "expiry");
    return json{
        {"receipt", order_service_->completeOrder(request, actorOf(r))}};
  };

  handlers_["cancelOrder"] = [this, actorOf](const json& r) {
    return json{{"order", order_service_->cancelOrder(
                              field<domain::OrderId>(r, "order_id"),
                              actorOf(r))}};
  };

  // --- Stock and recipe commands --------------------------------------------
  handlers_["receiveStock"] = [this, actorOf](const json& r) {
    return json{{"lot", receiveStock(parseStockReceipt(r), actorOf(r))}};
  };

  handlers_["createBom"] = [this, actorOf](const json& r) {
    return json{{"bom", createBom(parseBomDraft(r), actorOf(r))}};
  };

  handlers_["updateBomStatus"] = [this, actorOf](const json& r) {
    return json{{"bom", updateBomStatus(
                            field<domain::BomId>(r, "bom_id"),
                            enumField(r, "status", &domain::parseBomStatus),
                            actorOf(r))}};
  };

  // --- Order queries --------------------------------------------------------
  handlers_["listOrders"] = [this](const json& r) {
    OrderFilter filter;
    filter.status = optionalEnum(r, "status", &domain::parseOrderStatus);
    filter.bom_type = optionalEnum(r, "bom_type", &domain::parseBomType);
    filter.from = optionalDate(r, "from");
    filter.to = optionalDate(r, "to");
    filter.search = fieldOr<std::string>(r, "search", "");
    return json{{"orders", order_service_->listOrders(filter)}};
  };

  handlers_["getOrder"] = [this](const json& r) {
    domain::OrderId id = fieldOr<domain::OrderId>(r, "order_id", 0);
    if (id == 0) {
      const auto order_no = field<std::string>(r, "order_no");
      auto order = orders_->findOrderByNo(order_no);
      if (!order) {
        throw NotFoundError("Order " + order_no + " does not exist");
      }
      id = order->id;
    }
    return json{{"detail", order_service_->orderDetail(id)}};
  };

  handlers_["getRequirements"] = [this](const json& r) {
    return json{{"requirements", order_service_->requirements(
                                     field<domain::OrderId>(r, "order_id"))}};
  };

  handlers_["previewRequirements"] = [this](const json& r) {
    return json{{"requirements",
                 order_service_->previewRequirements(
                     field<domain::BomId>(r, "bom_id"),
                     field<double>(r, "planned_qty"),
                     field<domain::WarehouseId>(r, "warehouse_id"))}};
  };

  handlers_["previewAllocate"] = [this](const json& r) {
    return json{{"preview", allocator_->previewAllocate(
                                field<domain::ProductId>(r, "material_id"),
                                field<double>(r, "quantity"),
                                field<domain::WarehouseId>(r, "warehouse_id"))}};
  };

  // --- BOM queries ----------------------------------------------------------
  handlers_["listBoms"] = [this](const json& r) {
    BomFilter filter;
    filter.type = optionalEnum(r, "type", &domain::parseBomType);
    filter.status = optionalEnum(r, "bom_status", &domain::parseBomStatus);
    filter.search = fieldOr<std::string>(r, "search", "");
    return json{{"boms", boms_->list(filter)}};
  };

  handlers_["getBom"] = [this](const json& r) {
    return json{{"bom", boms_->get(field<domain::BomId>(r, "bom_id"))}};
  };

  handlers_["explodeBom"] = [this](const json& r) {
    return json{{"requirements",
                 BomExplosionCalculator::explode(
                     boms_->get(field<domain::BomId>(r, "bom_id")),
                     field<double>(r, "quantity"),
                     ExplosionPolicy{config_.require_active_bom})}};
  };

  handlers_["whereUsed"] = [this](const json& r) {
    return json{{"usages", genealogy_->whereUsed(
                               field<domain::ProductId>(r, "product_id"))}};
  };

  handlers_["materialUsage"] = [this](const json&) {
    return json{{"materials", boms_->materialUsageSummary()}};
  };

  // --- Stock queries --------------------------------------------------------
  handlers_["stockBalance"] = [this](const json& r) {
    const auto product = field<domain::ProductId>(r, "product_id");
    const auto warehouse = optionalField<domain::WarehouseId>(r, "warehouse_id");
    return json{{"product_id", product},
                {"balance", ledger_->balance(product, warehouse)},
                {"net_quantity", ledger_->netQuantity(product, warehouse)}};
  };

  handlers_["lotBreakdown"] = [this](const json& r) {
    return json{{"lots", ledger_->lotBreakdown(
                             field<domain::ProductId>(r, "product_id"),
                             field<domain::WarehouseId>(r, "warehouse_id"),
                             today())}};
  };

  handlers_["expiryReport"] = [this](const json& r) {
    return json{{"rows", ledger_->expiryReport(
                             fieldOr(r, "days_ahead",
                                     config_.expiry_warning_days),
                             today())}};
  };

  handlers_["movements"] = [this](const json& r) {
    return json{{"movements",
                 ledger_->movements(
                     field<domain::ProductId>(r, "product_id"),
                     optionalField<domain::WarehouseId>(r, "warehouse_id"))}};
  };

  handlers_["productionImpact"] = [this](const json& r) {
    return json{{"rows", ledger_->productionImpact(dateField(r, "from"),
                                                   dateField(r, "to"))}};
  };

  // --- Genealogy queries ----------------------------------------------------
  handlers_["traceBatch"] = [this](const json& r) {
    const auto batch_no = field<std::string>(r, "batch_no");
    auto info = genealogy_->batchInfo(batch_no);
    return json{{"batch", info ? json(*info) : json(nullptr)},
                {"sources", genealogy_->sourcesOf(batch_no)},
                {"locations", genealogy_->locationsOf(batch_no)}};
  };

  handlers_["orderBatches"] = [this](const json& r) {
    return json{{"batches", genealogy_->batchesProducedBy(
                                field<std::string>(r, "order_no"))}};
  };

  handlers_["orderGenealogy"] = [this](const json& r) {
    const auto order_id = field<domain::OrderId>(r, "order_id");
    orders_->getOrder(order_id);
    return json{
        {"links", genealogy_->linksFor(order_id)},
        {"inherited_expiry", dateToJson(genealogy_->inheritedExpiry(order_id))}};
  };

  // --- Reports --------------------------------------------------------------
  handlers_["productionSummary"] = [this](const json& r) {
    return json{{"summary", reports_->summary(dateField(r, "from"),
                                              dateField(r, "to"))}};
  };

  handlers_["dailyProduction"] = [this](const json& r) {
    return json{{"rows", reports_->dailyProduction(dateField(r, "from"),
                                                   dateField(r, "to"))}};
  };

  handlers_["materialConsumption"] = [this](const json& r) {
    return json{{"rows", reports_->materialConsumption(
                             dateField(r, "from"), dateField(r, "to"),
                             optionalField<domain::WarehouseId>(
                                 r, "warehouse_id"))}};
  };

  handlers_["statusDistribution"] = [this](const json& r) {
    return json{{"rows", reports_->statusDistribution(dateField(r, "from"),
                                                      dateField(r, "to"))}};
  };

  handlers_["efficiencyByType"] = [this](const json& r) {
    return json{{"rows", reports_->efficiencyByType(dateField(r, "from"),
                                                    dateField(r, "to"))}};
  };

  handlers_["recentActivities"] = [this](const json& r) {
    const int limit = fieldOr(r, "limit", 10);
    if (limit < 0) {
      throw ValidationError("limit must not be negative");
    }
    return json{{"activities",
                 reports_->recentActivities(static_cast<std::size_t>(limit))}};
  };

  // --- Master data ----------------------------------------------------------
  handlers_["listProducts"] = [this](const json&) {
    return json{{"products", master_data_->products()}};
  };

  handlers_["listWarehouses"] = [this](const json&) {
    return json{{"warehouses", master_data_->warehouses()}};
  };
}

CalendarDate ManufacturingEngine::today() const {
  return CalendarDate::fromEpochMs(time_provider_.now_ms());
}

json ManufacturingEngine::status() const {
  return json{{"today", today()},
              {"orders", orders_->orderCount()},
              {"ledger_entries", ledger_->size()},
              {"genealogy_links", genealogy_->linkCount()},
              {"boms", boms_->list().size()},
              {"ipc", ipc_server_ != nullptr}};
}

}  // namespace mfg
