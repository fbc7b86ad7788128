#pragma once

namespace relaynorm::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Upserts use ON CONFLICT ... DO UPDATE (never INSERT OR REPLACE) so
  rows referenced by foreign keys are updated in place.
*/

static constexpr const char* UPSERT_RELAY_MODEL =
    "INSERT INTO relay_models(model_code,manufacturer,detection_method) VALUES(?,?,?)"
    " ON CONFLICT(model_code) DO UPDATE SET"
    " manufacturer=excluded.manufacturer,"
    " detection_method=excluded.detection_method;";

static constexpr const char* UPSERT_EQUIPMENT =
    "INSERT INTO equipment(tag,substation,device_type,position,model_code) VALUES(?,?,?,?,?)"
    " ON CONFLICT(tag) DO UPDATE SET"
    " substation=excluded.substation,"
    " device_type=excluded.device_type,"
    " position=excluded.position,"
    " model_code=excluded.model_code;";

static constexpr const char* SELECT_EQUIPMENT =
    "SELECT tag,substation,device_type,position,model_code FROM equipment WHERE tag=?;";

static constexpr const char* UPSERT_SOURCE_DOCUMENT =
    "INSERT INTO source_documents(document_id,file_name,equipment_tag,model_code,encoding,page_count,content_digest,size_bytes,processed_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(document_id) DO UPDATE SET"
    " file_name=excluded.file_name,"
    " equipment_tag=excluded.equipment_tag,"
    " model_code=excluded.model_code,"
    " encoding=excluded.encoding,"
    " page_count=excluded.page_count,"
    " content_digest=excluded.content_digest,"
    " size_bytes=excluded.size_bytes,"
    " processed_at_ms=excluded.processed_at_ms;";

static constexpr const char* SELECT_SOURCE_DOCUMENT =
    "SELECT document_id,file_name,equipment_tag,model_code,encoding,page_count,content_digest,size_bytes,processed_at_ms"
    " FROM source_documents WHERE document_id=?;";

// per-document rows

static constexpr const char* DELETE_DOCUMENT_SETTINGS = "DELETE FROM settings WHERE document_id=?;";
static constexpr const char* DELETE_DOCUMENT_GROUPS   = "DELETE FROM multipart_groups WHERE document_id=?;";
static constexpr const char* DELETE_DOCUMENT_ACTIVE   = "DELETE FROM active_functions WHERE document_id=?;";

static constexpr const char* UPSERT_SETTING =
    "INSERT INTO settings(equipment_tag,parameter_code,description,value_type,value_numeric,value_text,unit,raw_value,"
    "is_multipart,multipart_base,multipart_part,is_active,detection_method,document_id,page_index)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(equipment_tag,parameter_code) DO UPDATE SET"
    " description=excluded.description,"
    " value_type=excluded.value_type,"
    " value_numeric=excluded.value_numeric,"
    " value_text=excluded.value_text,"
    " unit=excluded.unit,"
    " raw_value=excluded.raw_value,"
    " is_multipart=excluded.is_multipart,"
    " multipart_base=excluded.multipart_base,"
    " multipart_part=excluded.multipart_part,"
    " is_active=excluded.is_active,"
    " detection_method=excluded.detection_method,"
    " document_id=excluded.document_id,"
    " page_index=excluded.page_index;";

static constexpr const char* SELECT_SETTINGS =
    "SELECT equipment_tag,parameter_code,description,value_type,value_numeric,value_text,unit,raw_value,"
    "is_multipart,multipart_base,multipart_part,is_active,detection_method,document_id,page_index"
    " FROM settings WHERE equipment_tag=? ORDER BY parameter_code;";

static constexpr const char* COUNT_SETTINGS = "SELECT COUNT(*) FROM settings WHERE equipment_tag=? AND document_id=?;";

static constexpr const char* UPSERT_MULTIPART_GROUP =
    "INSERT INTO multipart_groups(equipment_tag,base,part_count,declared_total,document_id) VALUES(?,?,?,?,?)"
    " ON CONFLICT(equipment_tag,base) DO UPDATE SET"
    " part_count=excluded.part_count,"
    " declared_total=excluded.declared_total,"
    " document_id=excluded.document_id;";

static constexpr const char* SELECT_MULTIPART_GROUPS =
    "SELECT equipment_tag,base,part_count,declared_total,document_id FROM multipart_groups WHERE equipment_tag=? ORDER BY base;";

static constexpr const char* UPSERT_ACTIVE_FUNCTION =
    "INSERT INTO active_functions(equipment_tag,function_code,description,detection_method,group_index,ambiguous,document_id)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(equipment_tag,function_code) DO UPDATE SET"
    " description=excluded.description,"
    " detection_method=excluded.detection_method,"
    " group_index=excluded.group_index,"
    " ambiguous=excluded.ambiguous,"
    " document_id=excluded.document_id;";

static constexpr const char* SELECT_ACTIVE_FUNCTIONS =
    "SELECT equipment_tag,function_code,description,detection_method,group_index,ambiguous,document_id"
    " FROM active_functions WHERE equipment_tag=? ORDER BY function_code;";

static constexpr const char* COUNT_ACTIVE_FUNCTIONS = "SELECT COUNT(*) FROM active_functions WHERE equipment_tag=? AND document_id=?;";

} // namespace relaynorm::db::sql
