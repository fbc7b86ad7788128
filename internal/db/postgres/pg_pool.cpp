#include "pg_pool.hpp"

namespace relaynorm::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_relay_model",
               "INSERT INTO relay_models(model_code,manufacturer,detection_method) VALUES($1,$2,$3) "
               "ON CONFLICT(model_code) DO UPDATE SET manufacturer=EXCLUDED.manufacturer,detection_method=EXCLUDED.detection_method");

  conn.prepare("upsert_equipment",
               "INSERT INTO equipment(tag,substation,device_type,position,model_code) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(tag) DO UPDATE SET substation=EXCLUDED.substation,device_type=EXCLUDED.device_type,"
               "position=EXCLUDED.position,model_code=EXCLUDED.model_code");

  conn.prepare("upsert_source_document",
               "INSERT INTO source_documents(document_id,file_name,equipment_tag,model_code,encoding,page_count,content_digest,size_bytes,processed_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
               "ON CONFLICT(document_id) DO UPDATE SET file_name=EXCLUDED.file_name,equipment_tag=EXCLUDED.equipment_tag,"
               "model_code=EXCLUDED.model_code,encoding=EXCLUDED.encoding,page_count=EXCLUDED.page_count,"
               "content_digest=EXCLUDED.content_digest,size_bytes=EXCLUDED.size_bytes,processed_at_ms=EXCLUDED.processed_at_ms");

  conn.prepare("upsert_setting",
               "INSERT INTO settings(equipment_tag,parameter_code,description,value_type,value_numeric,value_text,unit,raw_value,"
               "is_multipart,multipart_base,multipart_part,is_active,detection_method,document_id,page_index) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15) "
               "ON CONFLICT(equipment_tag,parameter_code) DO UPDATE SET description=EXCLUDED.description,"
               "value_type=EXCLUDED.value_type,value_numeric=EXCLUDED.value_numeric,value_text=EXCLUDED.value_text,"
               "unit=EXCLUDED.unit,raw_value=EXCLUDED.raw_value,is_multipart=EXCLUDED.is_multipart,"
               "multipart_base=EXCLUDED.multipart_base,multipart_part=EXCLUDED.multipart_part,is_active=EXCLUDED.is_active,"
               "detection_method=EXCLUDED.detection_method,document_id=EXCLUDED.document_id,page_index=EXCLUDED.page_index");

  conn.prepare("upsert_multipart_group",
               "INSERT INTO multipart_groups(equipment_tag,base,part_count,declared_total,document_id) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(equipment_tag,base) DO UPDATE SET part_count=EXCLUDED.part_count,"
               "declared_total=EXCLUDED.declared_total,document_id=EXCLUDED.document_id");

  conn.prepare("upsert_active_function",
               "INSERT INTO active_functions(equipment_tag,function_code,description,detection_method,group_index,ambiguous,document_id) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) "
               "ON CONFLICT(equipment_tag,function_code) DO UPDATE SET description=EXCLUDED.description,"
               "detection_method=EXCLUDED.detection_method,group_index=EXCLUDED.group_index,"
               "ambiguous=EXCLUDED.ambiguous,document_id=EXCLUDED.document_id");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace relaynorm::db::postgres
