#ifndef BASIL_INTERFACE_H
#define BASIL_INTERFACE_H

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Every function returning char* returns a JSON response
 *   {"ok": true, "result": ...}  or
 *   {"ok": false, "error": {"kind": "...", "message": "..."}}
 * that the caller releases with basil_free_string().
 */

/**
 * @brief Create a campaign service.
 *
 * @param config_json Service configuration (workspace, optimizer_timeout_ms,
 * log_level, fallback_seed), or NULL for defaults.
 * @return Opaque pointer (handle) to the service, or NULL on error.
 */
void *basil_service_create(const char *config_json);

/**
 * @brief Destroy a service created by basil_service_create(). Open
 * campaigns are closed.
 */
void basil_service_destroy(void *service);

/**
 * @brief Create and open a campaign.
 *
 * @param spec_json {"name", "description", "parameters", "objectives",
 * "settings"}
 * @return Response whose result is the new campaign id.
 */
char *basil_create_campaign(void *service, const char *spec_json);

/**
 * @brief Replace a campaign's definition.
 *
 * @return Response whose result is {"structural": bool, "config": {...}}.
 */
char *basil_edit_campaign(void *service, const char *campaign_id,
                          const char *spec_json);

/// @return Response whose result is the campaign config.
char *basil_open_campaign(void *service, const char *campaign_id);

/// @return Response whose result is [{"id", "name", "version", "updated_at"}].
char *basil_list_campaigns(void *service);

/**
 * @brief Start generating a batch in the background.
 *
 * @return Opaque task handle, never NULL for a valid service. Errors,
 * including a bad batch size, are reported by basil_task_result().
 */
void *basil_generate_next_batch(void *service, const char *campaign_id,
                                int batch_size);

/// Progress of a task in [0, 1].
double basil_task_progress(void *task);

/// Request cancellation; the task ends with an OperationCancelled error if
/// the batch was not persisted yet.
void basil_task_cancel(void *task);

/// 1 if the task has finished, 0 otherwise.
int basil_task_done(void *task);

/**
 * @brief Wait for a task and return its outcome.
 *
 * @return Response whose result is the generated batch.
 */
char *basil_task_result(void *task);

/// Release a task handle; waits for the task if it still runs.
void basil_task_destroy(void *task);

/**
 * @brief Record the measurements of a pending batch.
 *
 * @param rows_json One object of objective values per row, in row order.
 * @return Response whose result is {"recorded": bool}; false when the batch
 * was already completed.
 */
char *basil_record_results(void *service, const char *campaign_id,
                           const char *batch_id, const char *rows_json);

/**
 * @brief Import previously measured experiments.
 *
 * @param runs_json [{"row": {...}, "values": {...}}]
 * @return Response whose result is the imported batch.
 */
char *basil_import_results(void *service, const char *campaign_id,
                           const char *runs_json);

/// @return Response whose result is {"batches": [...], "results": [...]}.
char *basil_get_history(void *service, const char *campaign_id);

/// @return Response whose result is the campaign config.
char *basil_get_config(void *service, const char *campaign_id);

/**
 * @brief Best observed row with the surrogate's mean and uncertainty there.
 *
 * @return Response whose result is {"row": {...}, "mean": number,
 * "uncertainty": number}, or null before any usable result.
 */
char *basil_best_arm(void *service, const char *campaign_id);

/// @return Response whose result is {"closed": bool}.
char *basil_close_campaign(void *service, const char *campaign_id);

/// @return Response whose result is the most recently opened id or null.
char *basil_recent_campaign(void *service);

/**
 * @brief Free a response string returned by this interface.
 */
void basil_free_string(char *str);

#ifdef __cplusplus
}
#endif

#endif /* BASIL_INTERFACE_H */
