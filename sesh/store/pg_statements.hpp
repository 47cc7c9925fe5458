#pragma once

#include <string>

namespace sesh::store::pg_statements {

/*
  Statement templates. {sessions} and {kv} are replaced with the (optionally
  schema qualified, already quoted) table names when the store is built.
  A positive ttl parameter becomes now() + ttl seconds, anything else NULL.
*/

inline constexpr const char *INIT_SCHEMA = R"sql(
create table if not exists {sessions} (
  id text primary key,
  expires_at timestamptz,
  created_at timestamptz not null default now(),
  updated_at timestamptz not null default now()
);
create table if not exists {kv} (
  session_id text not null references {sessions}(id)
    on update cascade on delete cascade,
  field_name text not null,
  value bytea not null,
  field_expires_at timestamptz,
  hot_ttl bigint,
  primary key (session_id, field_name)
);
create index if not exists sesh_sessions_expires_idx
  on {sessions}(expires_at) where expires_at is not null;
create index if not exists sesh_kv_expires_idx
  on {kv}(field_expires_at) where field_expires_at is not null;
)sql";

// $1 id, $2 field, $3 value, $4 session_ttl, $5 field_ttl, $6 hot_ttl
inline constexpr const char *SET = R"sql(
with stale as (
  delete from {kv} k
   using {sessions} s
   where s.id = $1::text
     and k.session_id = s.id
     and k.field_name <> $2::text
     and s.expires_at is not null and s.expires_at <= now()
),
sess as (
  insert into {sessions} as s (id, expires_at, created_at, updated_at)
  values ($1::text,
          case when $4::bigint > 0
               then now() + make_interval(secs => $4::bigint) end,
          now(), now())
  on conflict (id) do update set
    expires_at = case
      when $4::bigint is not null then excluded.expires_at
      when s.expires_at is not null and s.expires_at <= now() then null
      else s.expires_at end,
    created_at = case
      when s.expires_at is not null and s.expires_at <= now() then now()
      else s.created_at end,
    updated_at = now()
  returning s.id
)
insert into {kv} (session_id, field_name, value, field_expires_at, hot_ttl)
select sess.id, $2::text, $3::bytea,
       case when $5::bigint > 0
            then now() + make_interval(secs => $5::bigint) end,
       $6::bigint
  from sess
on conflict (session_id, field_name) do update set
  value = excluded.value,
  field_expires_at = excluded.field_expires_at,
  hot_ttl = excluded.hot_ttl
)sql";

/*
  $1 old id, $2 new id, $3 field, $4 value, $5 session_ttl, $6 field_ttl,
  $7 hot_ttl

  The live session row is re-keyed and the foreign key cascade moves its
  fields. A field that already exists is rewritten under the old key (the
  cascade then moves it), a new one is inserted under the new key, so the
  cascade and the insert never produce the same row. A taken new id fails
  the whole statement with unique_violation.
*/
inline constexpr const char *SET_AND_RENAME = R"sql(
with renamed as (
  update {sessions} s set
    id = $2::text,
    expires_at = case
      when $5::bigint is null then s.expires_at
      when $5::bigint > 0 then now() + make_interval(secs => $5::bigint)
      end,
    updated_at = now()
   where s.id = $1::text
     and (s.expires_at is null or s.expires_at > now())
  returning s.id
),
created as (
  insert into {sessions} (id, expires_at, created_at, updated_at)
  select $2::text,
         case when $5::bigint > 0
              then now() + make_interval(secs => $5::bigint) end,
         now(), now()
   where not exists (select 1 from renamed)
  returning id
),
rewritten as (
  update {kv} k set
    value = $4::bytea,
    field_expires_at = case when $6::bigint > 0
                            then now() + make_interval(secs => $6::bigint) end,
    hot_ttl = $7::bigint
   where k.session_id = $1::text
     and k.field_name = $3::text
     and exists (select 1 from renamed)
  returning k.field_name
)
insert into {kv} (session_id, field_name, value, field_expires_at, hot_ttl)
select $2::text, $3::text, $4::bytea,
       case when $6::bigint > 0
            then now() + make_interval(secs => $6::bigint) end,
       $7::bigint
 where not exists (select 1 from rewritten)
)sql";

/*
  $1 id, $2 field, $3 value, $4 session_ttl, $5 field_ttl, $6 hot_ttl

  SET that leaves a live field alone. An expired field row, or any row of an
  expired session, is overwritten. Returns one row with the number of fields
  written (0 or 1).
*/
inline constexpr const char *INSERT = R"sql(
with present as (
  select 1
    from {kv} k
    join {sessions} s on s.id = k.session_id
   where s.id = $1::text
     and k.field_name = $2::text
     and (s.expires_at is null or s.expires_at > now())
     and (k.field_expires_at is null or k.field_expires_at > now())
),
dead as (
  select 1
    from {sessions} s
   where s.id = $1::text
     and s.expires_at is not null and s.expires_at <= now()
),
stale as (
  delete from {kv} k
   using {sessions} s
   where s.id = $1::text
     and k.session_id = s.id
     and k.field_name <> $2::text
     and s.expires_at is not null and s.expires_at <= now()
),
sess as (
  insert into {sessions} as s (id, expires_at, created_at, updated_at)
  select $1::text,
         case when $4::bigint > 0
              then now() + make_interval(secs => $4::bigint) end,
         now(), now()
   where not exists (select 1 from present)
  on conflict (id) do update set
    expires_at = case
      when $4::bigint is not null then excluded.expires_at
      when s.expires_at is not null and s.expires_at <= now() then null
      else s.expires_at end,
    created_at = case
      when s.expires_at is not null and s.expires_at <= now() then now()
      else s.created_at end,
    updated_at = now()
  returning s.id
),
inserted as (
  insert into {kv} as k (session_id, field_name, value, field_expires_at,
                         hot_ttl)
  select sess.id, $2::text, $3::bytea,
         case when $5::bigint > 0
              then now() + make_interval(secs => $5::bigint) end,
         $6::bigint
    from sess
  on conflict (session_id, field_name) do update set
    value = excluded.value,
    field_expires_at = excluded.field_expires_at,
    hot_ttl = excluded.hot_ttl
   where (k.field_expires_at is not null and k.field_expires_at <= now())
      or exists (select 1 from dead)
  returning 1
)
select count(*) from inserted
)sql";

/*
  $1 old id, $2 new id, $3 field, $4 value, $5 session_ttl, $6 field_ttl,
  $7 hot_ttl

  SET_AND_RENAME whose field write is skipped when the moved record already
  holds a live field of that name. Returns one row with the number of fields
  written (0 or 1).
*/
inline constexpr const char *INSERT_AND_RENAME = R"sql(
with renamed as (
  update {sessions} s set
    id = $2::text,
    expires_at = case
      when $5::bigint is null then s.expires_at
      when $5::bigint > 0 then now() + make_interval(secs => $5::bigint)
      end,
    updated_at = now()
   where s.id = $1::text
     and (s.expires_at is null or s.expires_at > now())
  returning s.id
),
created as (
  insert into {sessions} (id, expires_at, created_at, updated_at)
  select $2::text,
         case when $5::bigint > 0
              then now() + make_interval(secs => $5::bigint) end,
         now(), now()
   where not exists (select 1 from renamed)
  returning id
),
present as (
  select 1
    from {kv} k
   where k.session_id = $1::text
     and k.field_name = $3::text
     and (k.field_expires_at is null or k.field_expires_at > now())
     and exists (select 1 from renamed)
),
rewritten as (
  update {kv} k set
    value = $4::bytea,
    field_expires_at = case when $6::bigint > 0
                            then now() + make_interval(secs => $6::bigint) end,
    hot_ttl = $7::bigint
   where k.session_id = $1::text
     and k.field_name = $3::text
     and exists (select 1 from renamed)
     and not exists (select 1 from present)
  returning k.field_name
),
inserted as (
  insert into {kv} (session_id, field_name, value, field_expires_at, hot_ttl)
  select $2::text, $3::text, $4::bytea,
         case when $6::bigint > 0
              then now() + make_interval(secs => $6::bigint) end,
         $7::bigint
   where not exists (select 1 from rewritten)
     and not exists (select 1 from present)
  returning 1
)
select (select count(*) from rewritten) + (select count(*) from inserted)
)sql";

/*
  $1 old id, $2 new id, $3 session_ttl

  Returns one row holding true when a live session already owns the new id,
  in which case nothing moved.
*/
inline constexpr const char *RENAME = R"sql(
with taken as (
  select 1
    from {sessions} s
   where s.id = $2::text
     and (s.expires_at is null or s.expires_at > now())
),
renamed as (
  update {sessions} s set
    id = $2::text,
    expires_at = case
      when $3::bigint is null then s.expires_at
      when $3::bigint > 0 then now() + make_interval(secs => $3::bigint)
      end,
    updated_at = now()
   where s.id = $1::text
     and (s.expires_at is null or s.expires_at > now())
     and not exists (select 1 from taken)
)
select exists (select 1 from taken)
)sql";

/*
  $1 old id, $2 new id

  A rename with a zero session ttl: the old session is deleted unless the new
  id is taken. Returns the same taken flag as RENAME.
*/
inline constexpr const char *RENAME_DELETE = R"sql(
with taken as (
  select 1
    from {sessions} s
   where s.id = $2::text
     and (s.expires_at is null or s.expires_at > now())
),
dropped as (
  delete from {sessions} s
   where s.id = $1::text
     and not exists (select 1 from taken)
)
select exists (select 1 from taken)
)sql";

/*
  $1 old id, $2 new id, $3 field, $4 session_ttl

  A rename with a zero field ttl. The field row is deleted under the old key
  before the cascade re-keys the rest. When it was the only live field the
  session is deleted instead of moved. Returns the same taken flag as RENAME.
*/
inline constexpr const char *RENAME_REMOVE = R"sql(
with taken as (
  select 1
    from {sessions} s
   where s.id = $2::text
     and (s.expires_at is null or s.expires_at > now())
),
source as (
  select s.id
    from {sessions} s
   where s.id = $1::text
     and (s.expires_at is null or s.expires_at > now())
     and not exists (select 1 from taken)
),
others as (
  select 1
    from {kv} k
   where k.session_id in (select id from source)
     and k.field_name <> $3::text
     and (k.field_expires_at is null or k.field_expires_at > now())
),
removed as (
  delete from {kv} k
   where k.session_id in (select id from source)
     and k.field_name = $3::text
     and exists (select 1 from others)
),
dropped as (
  delete from {sessions} s
   where s.id in (select id from source)
     and not exists (select 1 from others)
),
renamed as (
  update {sessions} s set
    id = $2::text,
    expires_at = case
      when $4::bigint is null then s.expires_at
      when $4::bigint > 0 then now() + make_interval(secs => $4::bigint)
      end,
    updated_at = now()
   where s.id in (select id from source)
     and exists (select 1 from others)
)
select exists (select 1 from taken)
)sql";

/*
  $1 id, $2 field, $3 session_ttl

  A set with a zero field ttl: the field is removed and the session ttl
  applied, or the session is deleted when no other live field remains.
*/
inline constexpr const char *SET_REMOVE = R"sql(
with others as (
  select 1
    from {kv} k
    join {sessions} s on s.id = k.session_id
   where s.id = $1::text
     and k.field_name <> $2::text
     and (s.expires_at is null or s.expires_at > now())
     and (k.field_expires_at is null or k.field_expires_at > now())
),
removed as (
  delete from {kv}
   where session_id = $1::text and field_name = $2::text
     and exists (select 1 from others)
),
dropped as (
  delete from {sessions} s
   where s.id = $1::text
     and not exists (select 1 from others)
)
update {sessions} s set
  expires_at = case when $3::bigint > 0
                    then now() + make_interval(secs => $3::bigint) end,
  updated_at = now()
 where s.id = $1::text
   and $3::bigint is not null
   and exists (select 1 from others)
)sql";

// $1 id, $2 field
inline constexpr const char *GET = R"sql(
select k.value
  from {kv} k
  join {sessions} s on s.id = k.session_id
 where s.id = $1::text
   and k.field_name = $2::text
   and (s.expires_at is null or s.expires_at > now())
   and (k.field_expires_at is null or k.field_expires_at > now())
)sql";

// $1 id
inline constexpr const char *GET_ALL = R"sql(
select k.field_name, k.value
  from {kv} k
  join {sessions} s on s.id = k.session_id
 where s.id = $1::text
   and (s.expires_at is null or s.expires_at > now())
   and (k.field_expires_at is null or k.field_expires_at > now())
)sql";

// $1 id
inline constexpr const char *GET_ALL_WITH_META = R"sql(
select k.field_name, k.value, k.hot_ttl,
       ceil(extract(epoch from
            least(s.expires_at, k.field_expires_at) - now()))::bigint,
       ceil(extract(epoch from s.expires_at - now()))::bigint
  from {kv} k
  join {sessions} s on s.id = k.session_id
 where s.id = $1::text
   and (s.expires_at is null or s.expires_at > now())
   and (k.field_expires_at is null or k.field_expires_at > now())
)sql";

// $1 id, $2 field
inline constexpr const char *REMOVE = R"sql(
with removed as (
  delete from {kv}
   where session_id = $1::text and field_name = $2::text
  returning session_id
)
delete from {sessions} s
 where s.id = $1::text
   and exists (select 1 from removed)
   and not exists (
     select 1 from {kv} k
      where k.session_id = $1::text
        and k.field_name <> $2::text
        and (k.field_expires_at is null or k.field_expires_at > now()))
)sql";

// $1 id
inline constexpr const char *DELETE = R"sql(
delete from {sessions} where id = $1::text
)sql";

// $1 id, $2 ttl (positive)
inline constexpr const char *EXPIRE = R"sql(
update {sessions} set
  expires_at = now() + make_interval(secs => $2::bigint),
  updated_at = now()
 where id = $1::text
   and (expires_at is null or expires_at > now())
)sql";

// Returns one row: (sessions reclaimed, fields reclaimed)
inline constexpr const char *SWEEP = R"sql(
with dead_sessions as (
  delete from {sessions}
   where expires_at is not null and expires_at <= now()
  returning id
),
empty_sessions as (
  delete from {sessions} s
   where (s.expires_at is null or s.expires_at > now())
     and not exists (
       select 1 from {kv} k
        where k.session_id = s.id
          and (k.field_expires_at is null or k.field_expires_at > now()))
  returning id
),
dead_fields as (
  delete from {kv}
   where field_expires_at is not null and field_expires_at <= now()
  returning session_id
)
select (select count(*) from dead_sessions)
         + (select count(*) from empty_sessions),
       (select count(*) from dead_fields)
)sql";

} // namespace sesh::store::pg_statements
